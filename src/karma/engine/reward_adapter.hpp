#pragma once

#include <string>
#include <string_view>

#include "karma/config/tables.hpp"
#include "karma/engine/evaluator.hpp"
#include "karma/model/types.hpp"

namespace karma {

// Bridges karma evaluation into a reinforcement-learning reward and a role suggestion.
class RewardAdapter {
public:
  explicit RewardAdapter(ConfigPtr config);

  [[nodiscard]] RewardAdjustment adapt(const BalanceSheet& sheet, std::string_view action,
                                       double base_reward) const;

  [[nodiscard]] double merit(const BalanceSheet& sheet) const;
  // Highest rung whose threshold does not exceed `merit`; the first rung otherwise.
  [[nodiscard]] std::string role_from_merit(double merit) const;

private:
  ConfigPtr config_;
  KarmaEvaluator evaluator_;
};

}  // namespace karma
