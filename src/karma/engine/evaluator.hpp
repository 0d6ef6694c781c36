#pragma once

#include <string_view>

#include "karma/config/tables.hpp"
#include "karma/engine/guidance.hpp"
#include "karma/model/types.hpp"

namespace karma {

std::string_view action_class_name(ActionClass classification);

class KarmaEvaluator {
public:
  explicit KarmaEvaluator(ConfigPtr config);

  // Total: any action string, including empty or unknown ones, yields a well-formed
  // evaluation. The sheet is only read by the recommender.
  [[nodiscard]] ActionEvaluation evaluate(const BalanceSheet& sheet, std::string_view action,
                                          double intensity = 1.0) const;

  [[nodiscard]] const KarmaConfig& config() const { return *config_; }

private:
  void apply_demerit(const DemeritRule& rule, ActionEvaluation& out) const;
  void apply_reward(const RewardRule& rule, ActionEvaluation& out) const;
  void apply_default(ActionEvaluation& out) const;
  void apply_purushartha(ActionEvaluation& out) const;

  ConfigPtr config_;
  CorrectiveGuidance guidance_;
};

}  // namespace karma
