#include "karma/engine/balance_sheet.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

#include "karma/config/tables.hpp"
#include "karma/util/canonical.hpp"

namespace karma {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Stored values that do not parse stay textual so readers can skip them.
Scalar scalar_from_text(std::string_view text) {
  if (const auto parsed = util::parse_double(text)) {
    return *parsed;
  }
  return std::string{util::trim_copy(text)};
}

void push_record(std::vector<DebtRecord>& out, std::string severity, const Scalar& amount) {
  const auto value = numeric_value(amount);
  if (!value) {
    return;
  }
  out.push_back(DebtRecord{std::move(severity), *value});
}

}  // namespace

std::optional<double> numeric_value(const Scalar& value) {
  if (const auto* number = std::get_if<double>(&value)) {
    if (!std::isfinite(*number)) {
      return std::nullopt;
    }
    return *number;
  }
  return util::parse_double(std::get<std::string>(value));
}

double scalar_balance(const BalanceSheet& sheet, std::string_view kind) {
  const auto it = sheet.find(std::string{kind});
  if (it == sheet.end()) {
    return 0.0;
  }

  return std::visit(Overloaded{
                        [](double number) { return std::isfinite(number) ? number : 0.0; },
                        [](const std::string& text) {
                          return util::parse_double(text).value_or(0.0);
                        },
                        [](const SeverityMap&) { return 0.0; },
                        [](const RecordList&) { return 0.0; },
                    },
                    it->second);
}

std::vector<DebtRecord> tiered_balance(const BalanceSheet& sheet, std::string_view kind) {
  std::vector<DebtRecord> records;
  const auto it = sheet.find(std::string{kind});
  if (it == sheet.end()) {
    return records;
  }

  std::visit(Overloaded{
                 [&](double number) {
                   push_record(records, std::string{kFallbackSeverity}, Scalar{number});
                 },
                 [&](const std::string& text) {
                   push_record(records, std::string{kFallbackSeverity}, Scalar{text});
                 },
                 [&](const SeverityMap& tiers) {
                   for (const auto& [severity, amount] : tiers) {
                     push_record(records, severity, amount);
                   }
                 },
                 [&](const RecordList& list) {
                   for (const auto& record : list) {
                     push_record(records, record.severity, record.amount);
                   }
                 },
             },
             it->second);
  return records;
}

std::vector<DebtRecord> normalize_debt(const BalanceSheet& sheet) {
  std::vector<DebtRecord> records = tiered_balance(sheet, kRnanubandhan);
  for (auto& record : records) {
    record.amount = std::fabs(record.amount);
  }
  return records;
}

Result parse_balance_sheet(std::string_view text, BalanceSheet& sheet) {
  std::size_t ignored = 0;

  std::istringstream in{std::string{text}};
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      ++ignored;
      continue;
    }

    std::string key = util::trim_copy(trimmed.substr(0, split));
    const std::string value = util::trim_copy(trimmed.substr(split + 1));
    if (key.empty()) {
      ++ignored;
      continue;
    }

    if (key.size() > 2 && key.ends_with("[]")) {
      key.resize(key.size() - 2);
      auto& slot = sheet[key];
      if (!std::holds_alternative<RecordList>(slot)) {
        slot = RecordList{};
      }

      DebtRecordValue record;
      const auto colon = value.find(':');
      if (colon == std::string::npos) {
        record.amount = scalar_from_text(value);
      } else {
        record.severity = util::trim_copy(value.substr(0, colon));
        record.amount = scalar_from_text(value.substr(colon + 1));
      }
      std::get<RecordList>(slot).push_back(std::move(record));
      continue;
    }

    const auto dot = key.find('.');
    if (dot != std::string::npos) {
      const std::string kind = key.substr(0, dot);
      const std::string tier = key.substr(dot + 1);
      if (kind.empty() || tier.empty()) {
        ++ignored;
        continue;
      }
      auto& slot = sheet[kind];
      if (!std::holds_alternative<SeverityMap>(slot)) {
        slot = SeverityMap{};
      }
      std::get<SeverityMap>(slot)[tier] = scalar_from_text(value);
      continue;
    }

    const Scalar scalar = scalar_from_text(value);
    if (const auto* number = std::get_if<double>(&scalar)) {
      sheet[key] = *number;
    } else {
      sheet[key] = std::get<std::string>(scalar);
    }
  }

  if (ignored == 0) {
    return Result::success("Balance sheet parsed.");
  }
  return Result::success("Balance sheet parsed; " + std::to_string(ignored) +
                         " malformed line(s) ignored.");
}

Result load_balance_sheet(std::string_view path, BalanceSheet& sheet) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure("Balance sheet not readable: " + std::string{path});
  }

  std::ostringstream contents;
  contents << in.rdbuf();
  return parse_balance_sheet(contents.str(), sheet);
}

}  // namespace karma
