#pragma once

#include <memory>

#include "karma/config/tables.hpp"
#include "karma/model/types.hpp"

namespace karma {

// Produces the `weighted_score` half of an aggregate.
class KarmaWeighting {
public:
  virtual ~KarmaWeighting() = default;
  [[nodiscard]] virtual double weighted_score(const BalanceSheet& sheet) const = 0;
};

// Dridha 0.8, Adridha 0.3, Sanchita and Prarabdha 1.0, minus the raw debt amount.
class DefaultKarmaWeighting final : public KarmaWeighting {
public:
  [[nodiscard]] double weighted_score(const BalanceSheet& sheet) const override;
};

class NetKarmaAggregator {
public:
  explicit NetKarmaAggregator(ConfigPtr config,
                              std::shared_ptr<const KarmaWeighting> weighting = nullptr);

  [[nodiscard]] NetKarma aggregate(const BalanceSheet& sheet) const;
  [[nodiscard]] PurusharthaVector purushartha_score(const BalanceSheet& sheet) const;
  [[nodiscard]] StabilityProfile stability_profile(const BalanceSheet& sheet) const;
  [[nodiscard]] DebtLedger debt_ledger(const BalanceSheet& sheet) const;
  [[nodiscard]] GuidanceSignals default_signals(const BalanceSheet& sheet) const;

private:
  ConfigPtr config_;
  std::shared_ptr<const KarmaWeighting> weighting_;
};

}  // namespace karma
