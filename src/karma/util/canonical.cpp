#include "karma/util/canonical.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iterator>
#include <ranges>
#include <system_error>

namespace karma::util {

std::int64_t unix_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string iso8601_utc_now() {
  const auto now = std::chrono::system_clock::now();
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif

  std::array<char, 32> date{};
  const std::size_t written = std::strftime(date.data(), date.size(), "%Y-%m-%dT%H:%M:%S", &utc);

  std::array<char, 8> fraction{};
  std::snprintf(fraction.data(), fraction.size(), ".%06lld", static_cast<long long>(micros));
  return std::string{date.data(), written} + fraction.data() + "Z";
}

std::string lowercase_copy(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::vector<std::string> split_list(std::string_view value, char separator) {
  std::vector<std::string> items;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= value.size(); ++i) {
    if (i == value.size() || value[i] == separator) {
      std::string item = trim_copy(value.substr(start, i - start));
      if (!item.empty()) {
        items.push_back(std::move(item));
      }
      start = i + 1U;
    }
  }
  return items;
}

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields) {
  std::ranges::stable_sort(fields, [](const auto& lhs, const auto& rhs) {
    return lhs.first < rhs.first;
  });

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key);
    payload.push_back('=');
    for (char c : value) {
      if (c == '\n') {
        payload.append("\\n");
      } else if (c == '\\') {
        payload.append("\\\\");
      } else {
        payload.push_back(c);
      }
    }
    payload.push_back('\n');
  }

  return payload;
}

namespace {

std::string unescape_value(std::string_view escaped) {
  std::string value;
  value.reserve(escaped.size());
  for (std::size_t i = 0; i < escaped.size(); ++i) {
    if (escaped[i] != '\\' || i + 1U == escaped.size()) {
      value.push_back(escaped[i]);
      continue;
    }
    ++i;
    value.push_back(escaped[i] == 'n' ? '\n' : escaped[i]);
  }
  return value;
}

}  // namespace

std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;

  // Values are escaped, so a raw newline always ends a record.
  while (!payload.empty()) {
    const std::size_t newline = payload.find('\n');
    const std::string_view record = payload.substr(0, newline);
    payload = newline == std::string_view::npos ? std::string_view{} : payload.substr(newline + 1U);

    const std::size_t separator = record.find('=');
    if (separator == std::string_view::npos || separator == 0U) {
      continue;
    }
    parsed.insert_or_assign(std::string{record.substr(0, separator)},
                            unescape_value(record.substr(separator + 1U)));
  }

  return parsed;
}

std::string to_hex(std::string_view bytes) {
  std::string out(bytes.size() * 2U, '0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    const auto byte = static_cast<unsigned char>(bytes[i]);
    char* slot = out.data() + (i * 2U) + (byte < 0x10U ? 1 : 0);
    std::to_chars(slot, out.data() + (i * 2U) + 2U, byte, 16);
  }
  return out;
}

std::string from_hex(std::string_view hex) {
  if ((hex.size() % 2U) != 0U) {
    return {};
  }

  std::string out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    const std::string_view pair = hex.substr(i, 2U);
    if (!std::ranges::all_of(pair, [](unsigned char c) { return std::isxdigit(c) != 0; })) {
      return {};
    }
    unsigned int byte = 0;
    std::from_chars(pair.data(), pair.data() + pair.size(), byte, 16);
    out.push_back(static_cast<char>(byte));
  }
  return out;
}

std::optional<double> parse_double(std::string_view text) {
  const std::string trimmed = trim_copy(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  const char* first = trimmed.data();
  const char* last = trimmed.data() + trimmed.size();
  if (*first == '+') {
    ++first;
  }

  double value = 0.0;
  const auto result = std::from_chars(first, last, value);
  if (result.ec != std::errc() || result.ptr != last || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::uint64_t> parse_uint64(std::string_view text) {
  std::uint64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string format_number(double value) {
  std::array<char, 64> buffer{};
  const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (result.ec != std::errc()) {
    return "0";
  }
  return std::string{buffer.data(), result.ptr};
}

}  // namespace karma::util
