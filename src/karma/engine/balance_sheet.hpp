#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "karma/model/types.hpp"

namespace karma {

inline constexpr std::string_view kDharmaPoints = "DharmaPoints";
inline constexpr std::string_view kSevaPoints = "SevaPoints";
inline constexpr std::string_view kPunyaTokens = "PunyaTokens";
inline constexpr std::string_view kPaapTokens = "PaapTokens";
inline constexpr std::string_view kDridhaKarma = "DridhaKarma";
inline constexpr std::string_view kAdridhaKarma = "AdridhaKarma";
inline constexpr std::string_view kSanchitaKarma = "SanchitaKarma";
inline constexpr std::string_view kPrarabdhaKarma = "PrarabdhaKarma";
inline constexpr std::string_view kRnanubandhan = "Rnanubandhan";

// Numeric reading of a stored amount; text that does not parse is nullopt.
std::optional<double> numeric_value(const Scalar& value);

// Scalar bucket reading. Missing, textual or structured values read as 0.
double scalar_balance(const BalanceSheet& sheet, std::string_view kind);

// Flattens any tiered bucket shape (map, record list, legacy scalar) into
// {severity, amount} records. Entries that are not numeric are skipped.
// Bare values carry the "major" severity.
std::vector<DebtRecord> tiered_balance(const BalanceSheet& sheet, std::string_view kind);

// Rnanubandhan records as magnitudes.
std::vector<DebtRecord> normalize_debt(const BalanceSheet& sheet);

// Parses the `key = value` sheet format:
//   DharmaPoints = 40
//   PaapTokens.minor = 5
//   Rnanubandhan = 12.5
//   Rnanubandhan[] = minor:4
Result parse_balance_sheet(std::string_view text, BalanceSheet& sheet);
Result load_balance_sheet(std::string_view path, BalanceSheet& sheet);

}  // namespace karma
