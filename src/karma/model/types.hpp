#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace karma {

struct Result {
  bool ok = false;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, std::move(msg), std::move(payload)};
  }

  static Result failure(std::string msg) {
    return {false, std::move(msg), {}};
  }
};

// Ordered key/value payload attached to ledger entries.
using Fields = std::vector<std::pair<std::string, std::string>>;

// ---------------------------------------------------------------------------
// Balance sheet

// A single stored amount. Text is kept as-is so that stray values coming from
// the persistence layer can be read leniently instead of rejected.
using Scalar = std::variant<double, std::string>;

using SeverityMap = std::map<std::string, Scalar>;

struct DebtRecordValue {
  std::string severity = "major";
  Scalar amount = 0.0;
};

using RecordList = std::vector<DebtRecordValue>;

using BalanceValue = std::variant<double, std::string, SeverityMap, RecordList>;
using BalanceSheet = std::map<std::string, BalanceValue>;

struct DebtRecord {
  std::string severity;
  double amount = 0.0;
};

// ---------------------------------------------------------------------------
// Evaluation

enum class Purushartha {
  Dharma,
  Artha,
  Kama,
  Moksha,
};

inline constexpr std::size_t kPurusharthaCount = 4;
using PurusharthaVector = std::array<double, kPurusharthaCount>;

enum class Urgency {
  Low = 1,
  Medium = 2,
  High = 3,
};

enum class ActionClass {
  Merit,
  Demerit,
  Default,
};

struct CorrectiveRecommendation {
  std::string practice;
  std::string reason;
  Urgency urgency = Urgency::Low;
  double weight = 0.0;
};

struct ActionEvaluation {
  std::string action;
  double intensity = 1.0;
  ActionClass classification = ActionClass::Default;
  std::string severity;
  double positive_impact = 0.0;
  double negative_impact = 0.0;
  double dridha_delta = 0.0;
  double adridha_delta = 0.0;
  double sanchita_delta = 0.0;
  double prarabdha_delta = 0.0;
  double rnanubandhan_delta = 0.0;
  PurusharthaVector purushartha{};
  double net_karma = 0.0;
  std::vector<CorrectiveRecommendation> corrective_recommendations;
};

struct KarmaBreakdown {
  double positive_karma = 0.0;
  double negative_karma = 0.0;
  double dridha_karma = 0.0;
  double adridha_karma = 0.0;
  double sanchita_karma = 0.0;
  double prarabdha_karma = 0.0;
  double rnanubandhan = 0.0;
};

struct NetKarma {
  double net_karma = 0.0;
  double weighted_score = 0.0;
  KarmaBreakdown breakdown;
};

struct StabilityProfile {
  double dridha_ratio = 0.5;
  double adridha_ratio = 0.5;
  double total = 0.0;
};

struct DebtTier {
  double amount = 0.0;
  double weighted_amount = 0.0;
};

struct DebtLedger {
  double total_debt = 0.0;
  std::size_t obligations = 0;
  std::map<std::string, DebtTier> severity_breakdown;
};

struct GuidanceSignals {
  double dridha_ratio = 0.5;
  double total_debt = 0.0;
};

struct RewardAdjustment {
  double adjusted_reward = 0.0;
  std::string next_role;
  double karmic_factor = 0.0;
  double merit = 0.0;
};

// ---------------------------------------------------------------------------
// Ledger

enum class LogLevel {
  Debug,
  Info,
  Warning,
  Error,
  Critical,
};

enum class EventType {
  ApiRequest,
  ApiResponse,
  ValidationError,
  KarmaAction,
  Atonement,
  SystemError,
  SecurityEvent,
  PerformanceMetric,
};

inline constexpr std::size_t kEventTypeCount = 8;

struct LedgerEntry {
  std::string timestamp;
  LogLevel level = LogLevel::Info;
  EventType event_type = EventType::ApiRequest;
  std::string component;
  std::optional<std::string> user_id;
  std::optional<std::string> session_id;
  std::string request_id;
  std::string message;
  Fields data;
  std::optional<Fields> error_details;
  std::optional<Fields> performance_metrics;

  std::uint64_t ledger_index = 0;
  std::string previous_hash;
  std::string entry_hash;
};

struct LedgerEventDraft {
  EventType event_type = EventType::ApiRequest;
  std::string component;
  std::string message;
  Fields data;
  std::string request_id;
  std::optional<std::string> user_id;
  std::optional<std::string> session_id;
  std::optional<Fields> error_details;
  std::optional<Fields> performance_metrics;
  std::optional<LogLevel> level;
};

struct TrailQuery {
  std::optional<std::string> user_id;
  std::optional<EventType> event_type;
  std::size_t limit = 100;
};

struct LedgerMetrics {
  std::array<std::uint64_t, kEventTypeCount> event_counts{};
  std::uint64_t api_requests = 0;
  std::uint64_t validation_errors = 0;
  std::uint64_t system_errors = 0;
  std::uint64_t security_events = 0;
  std::uint64_t karma_actions = 0;
  std::uint64_t atonement_completions = 0;
  std::map<std::string, std::uint64_t> error_breakdown;
  double average_response_time = 0.0;
  std::size_t total_audit_entries = 0;
  double uptime_hours = 0.0;
  std::uint64_t next_ledger_index = 0;
  std::string previous_hash;
  std::uint64_t dropped_writes = 0;
  std::uint64_t write_retries = 0;
};

struct ChainVerificationReport {
  bool intact = true;
  std::size_t checked = 0;
  std::vector<std::uint64_t> tampered_indices;
  std::vector<std::uint64_t> index_gaps;
  std::string details;
};

struct KarmaActionDraft {
  std::string request_id;
  std::string user_id;
  std::optional<std::string> session_id;
  std::string action;
  double intensity = 1.0;
  std::string role;
  std::string intent;
};

struct ActionLogOutcome {
  ActionEvaluation evaluation;
  Result ledger;
};

}  // namespace karma
