#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "karma/ledger/sink.hpp"
#include "karma/model/types.hpp"

namespace karma {

inline constexpr std::string_view kDiagnosticsLogFile = "ledger-diagnostics.log";

struct LedgerOptions {
  std::string data_dir;
  std::size_t trail_capacity = 10000;
  std::size_t write_retries = 2;
  std::size_t response_window = 1000;
  std::string diagnostics_file{kDiagnosticsLogFile};
  // Continue the chain already persisted by the sink instead of starting at genesis.
  bool resume_chain = true;
};

// Single-writer, append-only, hash-chained event log. Every public member is safe to call
// from multiple threads; one mutex serializes the whole record unit including the sink write.
class LedgerLogger {
public:
  LedgerLogger() = default;
  LedgerLogger(const LedgerLogger&) = delete;
  LedgerLogger& operator=(const LedgerLogger&) = delete;

  // Opens with the default per-channel file sink under `options.data_dir`.
  Result open(const LedgerOptions& options);
  Result open(const LedgerOptions& options, std::unique_ptr<LedgerSink> sink);
  [[nodiscard]] bool is_open() const;

  // On success `Result::data` holds the assigned ledger index. A failed write leaves the chain,
  // trail and counters untouched.
  Result record(const LedgerEventDraft& draft);

  Result log_api_request(std::string_view request_id, std::string_view method,
                         std::string_view path, const std::optional<std::string>& user_id = {},
                         const std::optional<std::string>& session_id = {},
                         const Fields& request_data = {});
  Result log_api_response(std::string_view request_id, int status_code,
                          double response_time_seconds, const Fields& response_data = {});
  Result log_validation_error(std::string_view request_id, std::string_view error_type,
                              std::string_view field, std::string_view error_message,
                              const std::optional<std::string>& user_id = {});
  Result log_karma_action(std::string_view request_id, std::string_view user_id,
                          std::string_view action, double karma_impact, std::string_view role,
                          std::string_view intent, const Fields& additional = {},
                          const std::optional<std::string>& session_id = {});
  Result log_atonement(std::string_view request_id, std::string_view user_id,
                       std::string_view plan_id, std::string_view atonement_type,
                       double karma_adjustment, double paap_reduction, bool success = true);
  Result log_system_error(std::string_view request_id, std::string_view error_type,
                          std::string_view error_message,
                          const std::optional<std::string>& stack_trace = {},
                          const std::optional<std::string>& user_id = {});
  Result log_security_event(std::string_view request_id, std::string_view event_type,
                            std::string_view description, std::string_view severity = "medium",
                            const std::optional<std::string>& user_id = {},
                            const Fields& additional = {});
  Result log_performance_metric(std::string_view request_id, std::string_view metric_name,
                                double value, std::string_view unit = "ms",
                                const std::optional<std::string>& user_id = {});

  [[nodiscard]] LedgerMetrics metrics() const;
  // Most recent matches from the in-memory trail, oldest first.
  [[nodiscard]] std::vector<LedgerEntry> audit_trail(const TrailQuery& query = {}) const;
  [[nodiscard]] std::vector<LedgerEntry> retained_entries() const;
  Result export_audit_trail(std::string_view path) const;

private:
  void count_locked(const LedgerEntry& entry);
  void record_diagnostic(std::string_view context, std::string_view reason) const;

  mutable std::mutex mutex_;
  LedgerOptions options_;
  std::unique_ptr<LedgerSink> sink_;
  std::string diagnostics_path_;
  std::chrono::steady_clock::time_point started_at_ = std::chrono::steady_clock::now();

  std::uint64_t next_index_ = 0;
  std::string previous_hash_;
  std::deque<LedgerEntry> trail_;
  std::deque<double> response_times_;
  LedgerMetrics counters_;
};

}  // namespace karma
