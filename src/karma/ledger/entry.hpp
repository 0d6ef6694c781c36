#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "karma/model/types.hpp"

namespace karma {

// Predecessor of ledger index 0.
inline const std::string kGenesisHash(64, '0');

std::string_view event_type_to_string(EventType type);
std::optional<EventType> event_type_from_string(std::string_view text);
std::string_view log_level_to_string(LogLevel level);
std::optional<LogLevel> log_level_from_string(std::string_view text);

// Drops duplicate keys (last value wins, first position kept) and replaces characters
// that would break the canonical encoding.
Fields normalize_fields(const Fields& fields);

// Sorted `key=value\n` encoding of every hashed field of `entry`.
std::string canonical_payload(const LedgerEntry& entry);
std::string compute_entry_hash(const LedgerEntry& entry, std::string_view previous_hash);

// index \t entry_hash \t previous_hash \t event_type \t component \t level \t timestamp \t
// hex(canonical payload) \n
std::string serialize_entry_line(const LedgerEntry& entry);
bool parse_entry_line(std::string_view line, LedgerEntry& out);

}  // namespace karma
