#include "karma/engine/reward_adapter.hpp"

#include <utility>

#include "karma/engine/balance_sheet.hpp"

namespace karma {

RewardAdapter::RewardAdapter(ConfigPtr config)
    : config_(std::move(config)), evaluator_(config_) {}

RewardAdjustment RewardAdapter::adapt(const BalanceSheet& sheet, std::string_view action,
                                      double base_reward) const {
  const ActionEvaluation evaluation = evaluator_.evaluate(sheet, action, 1.0);

  RewardAdjustment out;
  out.karmic_factor = evaluation.net_karma != 0.0 ? evaluation.net_karma / 100.0 : 0.0;
  out.adjusted_reward = base_reward * (1.0 + out.karmic_factor);
  out.merit = merit(sheet);
  out.next_role = role_from_merit(out.merit);
  return out;
}

double RewardAdapter::merit(const BalanceSheet& sheet) const {
  return scalar_balance(sheet, kDharmaPoints) * config_->merit_weight_dharma +
         scalar_balance(sheet, kSevaPoints) * config_->merit_weight_seva +
         scalar_balance(sheet, kPunyaTokens) * config_->merit_weight_punya;
}

std::string RewardAdapter::role_from_merit(double merit) const {
  if (config_->roles.empty()) {
    return {};
  }

  std::string role = config_->roles.front().name;
  for (const auto& rung : config_->roles) {
    if (merit >= rung.threshold) {
      role = rung.name;
    }
  }
  return role;
}

}  // namespace karma
