#include "karma/ledger/entry.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <unordered_map>
#include <utility>

#include "karma/util/canonical.hpp"
#include "karma/util/hash.hpp"

namespace karma {
namespace {

constexpr std::string_view kDataPrefix = "data.";
constexpr std::string_view kErrorKey = "error";
constexpr std::string_view kErrorPrefix = "error.";
constexpr std::string_view kPerfKey = "perf";
constexpr std::string_view kPerfPrefix = "perf.";

constexpr std::array<std::string_view, kEventTypeCount> kEventTypeNames = {
    "api_request",   "api_response",   "validation_error", "karma_action",
    "atonement",     "system_error",   "security_event",   "performance_metric",
};

// Keys must survive the `prefix.key=value` round trip, so an empty key becomes "_".
std::string sanitize_key(std::string_view key) {
  if (key.empty()) {
    return "_";
  }
  std::string out{key};
  std::ranges::replace(out, '=', '_');
  std::ranges::replace(out, '\n', '_');
  return out;
}

void append_prefixed(std::vector<std::pair<std::string, std::string>>& out,
                     std::string_view prefix, const Fields& fields) {
  for (const auto& [key, value] : normalize_fields(fields)) {
    out.emplace_back(std::string{prefix} + key, value);
  }
}

Fields collect_prefixed(const std::unordered_map<std::string, std::string>& map,
                        std::string_view prefix) {
  Fields out;
  for (const auto& [key, value] : map) {
    if (key.size() > prefix.size() && key.starts_with(prefix)) {
      out.emplace_back(key.substr(prefix.size()), value);
    }
  }
  std::ranges::sort(out, [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
  return out;
}

std::optional<std::string> lookup(const std::unordered_map<std::string, std::string>& map,
                                  std::string_view key) {
  const auto it = map.find(std::string{key});
  if (it == map.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

std::string_view event_type_to_string(EventType type) {
  return kEventTypeNames[static_cast<std::size_t>(type)];
}

std::optional<EventType> event_type_from_string(std::string_view text) {
  for (std::size_t i = 0; i < kEventTypeNames.size(); ++i) {
    if (kEventTypeNames[i] == text) {
      return static_cast<EventType>(i);
    }
  }
  return std::nullopt;
}

std::string_view log_level_to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Critical:
      return "CRITICAL";
  }
  return "INFO";
}

std::optional<LogLevel> log_level_from_string(std::string_view text) {
  if (text == "DEBUG") {
    return LogLevel::Debug;
  }
  if (text == "INFO") {
    return LogLevel::Info;
  }
  if (text == "WARNING") {
    return LogLevel::Warning;
  }
  if (text == "ERROR") {
    return LogLevel::Error;
  }
  if (text == "CRITICAL") {
    return LogLevel::Critical;
  }
  return std::nullopt;
}

Fields normalize_fields(const Fields& fields) {
  Fields out;
  out.reserve(fields.size());
  for (const auto& [raw_key, value] : fields) {
    std::string key = sanitize_key(raw_key);
    const auto existing = std::ranges::find_if(out, [&](const auto& field) {
      return field.first == key;
    });
    if (existing != out.end()) {
      existing->second = value;
    } else {
      out.emplace_back(std::move(key), value);
    }
  }
  return out;
}

std::string canonical_payload(const LedgerEntry& entry) {
  std::vector<std::pair<std::string, std::string>> fields{
      {"timestamp", entry.timestamp},
      {"level", std::string{log_level_to_string(entry.level)}},
      {"event_type", std::string{event_type_to_string(entry.event_type)}},
      {"component", entry.component},
      {"request_id", entry.request_id},
      {"message", entry.message},
      {"ledger_index", std::to_string(entry.ledger_index)},
  };
  if (entry.user_id) {
    fields.emplace_back("user_id", *entry.user_id);
  }
  if (entry.session_id) {
    fields.emplace_back("session_id", *entry.session_id);
  }

  append_prefixed(fields, kDataPrefix, entry.data);
  if (entry.error_details) {
    const Fields details = normalize_fields(*entry.error_details);
    fields.emplace_back(std::string{kErrorKey}, std::to_string(details.size()));
    append_prefixed(fields, kErrorPrefix, details);
  }
  if (entry.performance_metrics) {
    const Fields metrics = normalize_fields(*entry.performance_metrics);
    fields.emplace_back(std::string{kPerfKey}, std::to_string(metrics.size()));
    append_prefixed(fields, kPerfPrefix, metrics);
  }

  return util::canonical_join(std::move(fields));
}

std::string compute_entry_hash(const LedgerEntry& entry, std::string_view previous_hash) {
  return util::chained_hash(canonical_payload(entry), previous_hash);
}

std::string serialize_entry_line(const LedgerEntry& entry) {
  std::ostringstream out;
  out << entry.ledger_index << '\t' << entry.entry_hash << '\t' << entry.previous_hash << '\t'
      << event_type_to_string(entry.event_type) << '\t' << entry.component << '\t'
      << log_level_to_string(entry.level) << '\t' << entry.timestamp << '\t'
      << util::to_hex(canonical_payload(entry)) << '\n';
  return out.str();
}

bool parse_entry_line(std::string_view line, LedgerEntry& out) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }

  std::array<std::string_view, 8> columns{};
  std::size_t column_index = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == '\t') {
      if (column_index >= columns.size()) {
        return false;
      }
      columns[column_index++] = line.substr(start, i - start);
      start = i + 1U;
    }
  }
  if (column_index != columns.size()) {
    return false;
  }

  const auto index = util::parse_uint64(columns[0]);
  const std::string payload = util::from_hex(columns[7]);
  if (!index || payload.empty()) {
    return false;
  }

  const auto map = util::parse_canonical_map(payload);
  const auto event_type = event_type_from_string(lookup(map, "event_type").value_or(""));
  const auto level = log_level_from_string(lookup(map, "level").value_or(""));
  const auto stored_index = util::parse_uint64(lookup(map, "ledger_index").value_or(""));
  if (!event_type || !level || !stored_index || *stored_index != *index) {
    return false;
  }

  LedgerEntry entry;
  entry.ledger_index = *index;
  entry.entry_hash = std::string{columns[1]};
  entry.previous_hash = std::string{columns[2]};
  entry.event_type = *event_type;
  entry.level = *level;
  entry.timestamp = lookup(map, "timestamp").value_or("");
  entry.component = lookup(map, "component").value_or("");
  entry.request_id = lookup(map, "request_id").value_or("");
  entry.message = lookup(map, "message").value_or("");
  entry.user_id = lookup(map, "user_id");
  entry.session_id = lookup(map, "session_id");
  entry.data = collect_prefixed(map, kDataPrefix);
  if (map.contains(std::string{kErrorKey})) {
    entry.error_details = collect_prefixed(map, kErrorPrefix);
  }
  if (map.contains(std::string{kPerfKey})) {
    entry.performance_metrics = collect_prefixed(map, kPerfPrefix);
  }

  // The readable columns must agree with the hashed payload.
  if (columns[3] != event_type_to_string(entry.event_type) || columns[4] != entry.component ||
      columns[5] != log_level_to_string(entry.level) || columns[6] != entry.timestamp) {
    return false;
  }

  out = std::move(entry);
  return true;
}

}  // namespace karma
