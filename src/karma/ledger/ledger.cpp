#include "karma/ledger/ledger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <utility>

#include "karma/ledger/entry.hpp"
#include "karma/model/app_meta.hpp"
#include "karma/util/canonical.hpp"
#include "karma/util/hash.hpp"

namespace karma {
namespace {

LogLevel level_for_component(std::string_view component) {
  if (component == "validation" || component == "security") {
    return LogLevel::Warning;
  }
  if (component == "system") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

// Channel files are tab separated, so the component column cannot carry tabs or newlines.
std::string sanitize_component(std::string_view component) {
  std::string out{component};
  std::ranges::replace(out, '\t', '_');
  std::ranges::replace(out, '\n', '_');
  std::ranges::replace(out, '\r', '_');
  return out;
}

std::optional<std::string> field_value(const Fields& fields, std::string_view key) {
  for (auto it = fields.rbegin(); it != fields.rend(); ++it) {
    if (it->first == key) {
      return it->second;
    }
  }
  return std::nullopt;
}

void append_nested(Fields& out, std::string_view prefix, const Fields& nested) {
  for (const auto& [key, value] : nested) {
    out.emplace_back(std::string{prefix} + "." + key, value);
  }
}

std::string bool_text(bool value) {
  return value ? "true" : "false";
}

}  // namespace

Result LedgerLogger::open(const LedgerOptions& options) {
  auto sink = std::make_unique<FileLedgerSink>();
  const Result opened = sink->open(options.data_dir);
  if (!opened.ok) {
    return opened;
  }
  return open(options, std::move(sink));
}

Result LedgerLogger::open(const LedgerOptions& options, std::unique_ptr<LedgerSink> sink) {
  if (!sink) {
    return Result::failure("Ledger sink is required.");
  }
  if (options.trail_capacity == 0) {
    return Result::failure("Ledger trail capacity must be at least 1.");
  }
  if (!util::initialize_hashing()) {
    return Result::failure("Failed to initialize libsodium.");
  }

  std::lock_guard lock(mutex_);
  options_ = options;
  sink_ = std::move(sink);
  diagnostics_path_.clear();
  if (!options_.data_dir.empty() && !options_.diagnostics_file.empty()) {
    diagnostics_path_ =
        (std::filesystem::path{options_.data_dir} / options_.diagnostics_file).string();
  }

  started_at_ = std::chrono::steady_clock::now();
  trail_.clear();
  response_times_.clear();
  counters_ = LedgerMetrics{};
  next_index_ = 0;
  previous_hash_ = kGenesisHash;

  if (options_.resume_chain) {
    if (const auto head = sink_->recover_head()) {
      next_index_ = head->next_index;
      previous_hash_ = head->previous_hash;
      return Result::success("Ledger resumed at index " + std::to_string(next_index_) + ".");
    }
  }
  return Result::success("Ledger opened at genesis.");
}

bool LedgerLogger::is_open() const {
  std::lock_guard lock(mutex_);
  return sink_ != nullptr;
}

Result LedgerLogger::record(const LedgerEventDraft& draft) {
  std::lock_guard lock(mutex_);
  if (!sink_) {
    return Result::failure("Ledger is not open.");
  }

  LedgerEntry entry;
  entry.timestamp = util::iso8601_utc_now();
  entry.component = sanitize_component(draft.component);
  entry.level = draft.level.value_or(level_for_component(entry.component));
  entry.event_type = draft.event_type;
  entry.user_id = draft.user_id;
  entry.session_id = draft.session_id;
  entry.request_id = draft.request_id;
  entry.message = draft.message;
  entry.data = normalize_fields(draft.data);
  if (draft.error_details) {
    entry.error_details = normalize_fields(*draft.error_details);
  }
  if (draft.performance_metrics) {
    entry.performance_metrics = normalize_fields(*draft.performance_metrics);
  }
  entry.ledger_index = next_index_;
  entry.previous_hash = previous_hash_;
  entry.entry_hash = compute_entry_hash(entry, entry.previous_hash);

  const std::string line = serialize_entry_line(entry);
  Result written = Result::failure("Ledger write not attempted.");
  for (std::size_t attempt = 0; attempt <= options_.write_retries; ++attempt) {
    if (attempt > 0) {
      ++counters_.write_retries;
    }
    written = sink_->write(entry, line);
    if (written.ok) {
      break;
    }
  }

  if (!written.ok) {
    ++counters_.dropped_writes;
    record_diagnostic("ledger-write",
                      "dropped index " + std::to_string(entry.ledger_index) + " (" +
                          std::string{event_type_to_string(entry.event_type)} +
                          "): " + written.message);
    return Result::failure("Ledger write dropped: " + written.message);
  }

  count_locked(entry);

  const std::uint64_t index = entry.ledger_index;
  next_index_ = index + 1U;
  previous_hash_ = entry.entry_hash;
  trail_.push_back(std::move(entry));
  while (trail_.size() > options_.trail_capacity) {
    trail_.pop_front();
  }

  return Result::success("Ledger entry recorded.", std::to_string(index));
}

void LedgerLogger::count_locked(const LedgerEntry& entry) {
  ++counters_.event_counts[static_cast<std::size_t>(entry.event_type)];

  switch (entry.event_type) {
    case EventType::ApiRequest:
      ++counters_.api_requests;
      break;
    case EventType::ApiResponse:
      if (entry.performance_metrics) {
        const auto millis = field_value(*entry.performance_metrics, "response_time_ms");
        if (const auto parsed = util::parse_double(millis.value_or(""))) {
          response_times_.push_back(*parsed / 1000.0);
          while (response_times_.size() > options_.response_window) {
            response_times_.pop_front();
          }
        }
      }
      break;
    case EventType::ValidationError: {
      ++counters_.validation_errors;
      const auto error_type = field_value(entry.data, "error_type");
      const auto field = field_value(entry.data, "field");
      if (error_type || field) {
        ++counters_.error_breakdown[error_type.value_or("") + ":" + field.value_or("")];
      }
      break;
    }
    case EventType::KarmaAction:
      ++counters_.karma_actions;
      break;
    case EventType::Atonement:
      if (entry.level != LogLevel::Error) {
        ++counters_.atonement_completions;
      }
      break;
    case EventType::SystemError:
      ++counters_.system_errors;
      break;
    case EventType::SecurityEvent:
      ++counters_.security_events;
      break;
    case EventType::PerformanceMetric:
      break;
  }
}

void LedgerLogger::record_diagnostic(std::string_view context, std::string_view reason) const {
  if (diagnostics_path_.empty()) {
    return;
  }

  std::ofstream out(diagnostics_path_, std::ios::out | std::ios::app);
  if (!out) {
    return;
  }
  out << util::unix_timestamp_now() << "\t" << context << "\t" << reason << "\n";
}

Result LedgerLogger::log_api_request(std::string_view request_id, std::string_view method,
                                     std::string_view path,
                                     const std::optional<std::string>& user_id,
                                     const std::optional<std::string>& session_id,
                                     const Fields& request_data) {
  LedgerEventDraft draft;
  draft.event_type = EventType::ApiRequest;
  draft.component = "api";
  draft.request_id = std::string{request_id};
  draft.user_id = user_id;
  draft.session_id = session_id;
  draft.message = "API Request: " + std::string{method} + " " + std::string{path};
  draft.data = {{"method", std::string{method}}, {"path", std::string{path}}};
  append_nested(draft.data, "request_data", request_data);
  draft.level = LogLevel::Info;
  return record(draft);
}

Result LedgerLogger::log_api_response(std::string_view request_id, int status_code,
                                      double response_time_seconds,
                                      const Fields& response_data) {
  const std::string status = std::to_string(status_code);

  LedgerEventDraft draft;
  draft.event_type = EventType::ApiResponse;
  draft.component = "api";
  draft.request_id = std::string{request_id};
  draft.message = "API Response: " + status;
  draft.data = {{"status_code", status}};
  append_nested(draft.data, "response_data", response_data);
  draft.performance_metrics = Fields{
      {"response_time_ms", util::format_number(response_time_seconds * 1000.0)},
      {"status_code", status},
  };
  draft.level = LogLevel::Info;
  return record(draft);
}

Result LedgerLogger::log_validation_error(std::string_view request_id, std::string_view error_type,
                                          std::string_view field, std::string_view error_message,
                                          const std::optional<std::string>& user_id) {
  LedgerEventDraft draft;
  draft.event_type = EventType::ValidationError;
  draft.component = "validation";
  draft.request_id = std::string{request_id};
  draft.user_id = user_id;
  draft.message = "Validation failed: " + std::string{error_message};
  draft.data = {
      {"error_type", std::string{error_type}},
      {"field", std::string{field}},
      {"error_message", std::string{error_message}},
  };
  draft.level = LogLevel::Warning;
  return record(draft);
}

Result LedgerLogger::log_karma_action(std::string_view request_id, std::string_view user_id,
                                      std::string_view action, double karma_impact,
                                      std::string_view role, std::string_view intent,
                                      const Fields& additional,
                                      const std::optional<std::string>& session_id) {
  LedgerEventDraft draft;
  draft.event_type = EventType::KarmaAction;
  draft.component = "karma_engine";
  draft.request_id = std::string{request_id};
  draft.user_id = std::string{user_id};
  draft.session_id = session_id;
  draft.message = "Karma action logged: " + std::string{action};
  draft.data = {
      {"action", std::string{action}},
      {"karma_impact", util::format_number(karma_impact)},
      {"role", std::string{role}},
      {"intent", std::string{intent}},
  };
  append_nested(draft.data, "additional_data", additional);
  draft.level = LogLevel::Info;
  return record(draft);
}

Result LedgerLogger::log_atonement(std::string_view request_id, std::string_view user_id,
                                   std::string_view plan_id, std::string_view atonement_type,
                                   double karma_adjustment, double paap_reduction, bool success) {
  LedgerEventDraft draft;
  draft.event_type = EventType::Atonement;
  draft.component = "atonement";
  draft.request_id = std::string{request_id};
  draft.user_id = std::string{user_id};
  draft.message = std::string{success ? "Atonement completed: " : "Atonement failed: "} +
                  std::string{atonement_type};
  draft.data = {
      {"plan_id", std::string{plan_id}},
      {"atonement_type", std::string{atonement_type}},
      {"karma_adjustment", util::format_number(karma_adjustment)},
      {"paap_reduction", util::format_number(paap_reduction)},
      {"success", bool_text(success)},
  };
  draft.level = success ? LogLevel::Info : LogLevel::Error;
  return record(draft);
}

Result LedgerLogger::log_system_error(std::string_view request_id, std::string_view error_type,
                                      std::string_view error_message,
                                      const std::optional<std::string>& stack_trace,
                                      const std::optional<std::string>& user_id) {
  LedgerEventDraft draft;
  draft.event_type = EventType::SystemError;
  draft.component = "system";
  draft.request_id = std::string{request_id};
  draft.user_id = user_id;
  draft.message = "System error: " + std::string{error_message};
  draft.data = {
      {"error_type", std::string{error_type}},
      {"error_message", std::string{error_message}},
  };
  draft.error_details = Fields{};
  if (stack_trace) {
    draft.error_details->emplace_back("stack_trace", *stack_trace);
  }
  draft.level = LogLevel::Error;
  return record(draft);
}

Result LedgerLogger::log_security_event(std::string_view request_id, std::string_view event_type,
                                        std::string_view description, std::string_view severity,
                                        const std::optional<std::string>& user_id,
                                        const Fields& additional) {
  LedgerEventDraft draft;
  draft.event_type = EventType::SecurityEvent;
  draft.component = "security";
  draft.request_id = std::string{request_id};
  draft.user_id = user_id;
  draft.message = "Security event: " + std::string{description};
  draft.data = {
      {"event_type", std::string{event_type}},
      {"description", std::string{description}},
      {"severity", std::string{severity}},
  };
  append_nested(draft.data, "additional_data", additional);
  draft.level =
      (severity == "low" || severity == "medium") ? LogLevel::Warning : LogLevel::Error;
  return record(draft);
}

Result LedgerLogger::log_performance_metric(std::string_view request_id,
                                            std::string_view metric_name, double value,
                                            std::string_view unit,
                                            const std::optional<std::string>& user_id) {
  const std::string value_text = util::format_number(value);

  LedgerEventDraft draft;
  draft.event_type = EventType::PerformanceMetric;
  draft.component = "performance";
  draft.request_id = std::string{request_id};
  draft.user_id = user_id;
  draft.message = "Performance metric: " + std::string{metric_name} + " = " + value_text + " " +
                  std::string{unit};
  draft.data = {
      {"metric_name", std::string{metric_name}},
      {"value", value_text},
      {"unit", std::string{unit}},
  };
  draft.performance_metrics = draft.data;
  draft.level = LogLevel::Info;
  return record(draft);
}

LedgerMetrics LedgerLogger::metrics() const {
  std::lock_guard lock(mutex_);
  LedgerMetrics out = counters_;
  if (!response_times_.empty()) {
    out.average_response_time =
        std::accumulate(response_times_.begin(), response_times_.end(), 0.0) /
        static_cast<double>(response_times_.size());
  }
  out.total_audit_entries = trail_.size();
  out.uptime_hours =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count() /
      3600.0;
  out.next_ledger_index = next_index_;
  out.previous_hash = previous_hash_;
  return out;
}

std::vector<LedgerEntry> LedgerLogger::audit_trail(const TrailQuery& query) const {
  std::lock_guard lock(mutex_);
  std::vector<LedgerEntry> matches;
  if (query.limit == 0) {
    return matches;
  }

  for (auto it = trail_.rbegin(); it != trail_.rend() && matches.size() < query.limit; ++it) {
    if (query.user_id && it->user_id != query.user_id) {
      continue;
    }
    if (query.event_type && it->event_type != *query.event_type) {
      continue;
    }
    matches.push_back(*it);
  }
  std::ranges::reverse(matches);
  return matches;
}

std::vector<LedgerEntry> LedgerLogger::retained_entries() const {
  std::lock_guard lock(mutex_);
  return {trail_.begin(), trail_.end()};
}

Result LedgerLogger::export_audit_trail(std::string_view path) const {
  const std::vector<LedgerEntry> entries = retained_entries();

  std::ofstream out(std::string{path}, std::ios::out | std::ios::trunc);
  if (!out) {
    return Result::failure("Failed to open audit export file: " + std::string{path});
  }

  out << "#\t" << kExportFormat << '\t' << util::iso8601_utc_now() << '\t' << entries.size()
      << '\n';
  for (const auto& entry : entries) {
    out << serialize_entry_line(entry);
  }
  out.flush();
  if (!out.good()) {
    return Result::failure("Failed to write audit export file: " + std::string{path});
  }

  return Result::success("Exported " + std::to_string(entries.size()) + " ledger entries.",
                         std::to_string(entries.size()));
}

}  // namespace karma
