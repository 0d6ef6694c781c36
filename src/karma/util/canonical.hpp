#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace karma::util {

std::int64_t unix_timestamp_now();
std::string iso8601_utc_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);
std::vector<std::string> split_list(std::string_view value, char separator = ',');

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::string to_hex(std::string_view bytes);
std::string from_hex(std::string_view hex);

std::optional<double> parse_double(std::string_view text);
std::optional<std::uint64_t> parse_uint64(std::string_view text);
std::string format_number(double value);

}  // namespace karma::util
