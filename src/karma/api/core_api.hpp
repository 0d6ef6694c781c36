#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "karma/config/tables.hpp"
#include "karma/engine/aggregator.hpp"
#include "karma/engine/evaluator.hpp"
#include "karma/engine/guidance.hpp"
#include "karma/engine/reward_adapter.hpp"
#include "karma/ledger/ledger.hpp"
#include "karma/model/types.hpp"

namespace karma {

struct InitConfig {
  std::string app_data_dir;
  // Optional `key = value` overrides applied on top of the built-in tables.
  std::string config_path;
  bool resume_chain = true;
};

// Owns one configuration and one ledger and wires the scoring components together. This is
// the surface an HTTP layer calls into.
class CoreApi {
public:
  CoreApi();

  // Fails once the ledger is open; a CoreApi is initialized at most once.
  Result init(const InitConfig& config);
  Result init(const InitConfig& config, std::unique_ptr<LedgerSink> sink);

  [[nodiscard]] ActionEvaluation evaluate(const BalanceSheet& sheet, std::string_view action,
                                          double intensity = 1.0) const;
  [[nodiscard]] NetKarma net_karma(const BalanceSheet& sheet) const;
  [[nodiscard]] std::vector<CorrectiveRecommendation> corrective_guidance(
      const BalanceSheet& sheet) const;
  [[nodiscard]] std::vector<CorrectiveRecommendation> corrective_guidance(
      const BalanceSheet& sheet, const GuidanceSignals& signals) const;
  [[nodiscard]] RewardAdjustment adapt_reward(const BalanceSheet& sheet, std::string_view action,
                                              double base_reward) const;
  [[nodiscard]] PurusharthaVector purushartha_score(const BalanceSheet& sheet) const;
  [[nodiscard]] StabilityProfile stability_profile(const BalanceSheet& sheet) const;
  [[nodiscard]] DebtLedger debt_ledger(const BalanceSheet& sheet) const;

  // Evaluates the action and records it as a karma_action entry. A ledger failure is
  // reported in `ledger` and never discards the evaluation.
  ActionLogOutcome log_action(const BalanceSheet& sheet, const KarmaActionDraft& draft);

  [[nodiscard]] LedgerLogger& ledger() { return ledger_; }
  [[nodiscard]] const LedgerLogger& ledger() const { return ledger_; }
  [[nodiscard]] const KarmaConfig& config() const { return *config_; }

private:
  struct Engines {
    explicit Engines(const ConfigPtr& config)
        : evaluator(config), aggregator(config), guidance(config), rewards(config) {}

    KarmaEvaluator evaluator;
    NetKarmaAggregator aggregator;
    CorrectiveGuidance guidance;
    RewardAdapter rewards;
  };

  Result load_config(const InitConfig& config);

  ConfigPtr config_;
  std::unique_ptr<Engines> engines_;
  LedgerLogger ledger_;
};

}  // namespace karma
