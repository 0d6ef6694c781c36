#pragma once

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "karma/model/types.hpp"

namespace karma {

inline constexpr std::string_view kFallbackSeverity = "major";

struct SeverityTable {
  std::map<std::string, double> multipliers;

  [[nodiscard]] std::optional<double> find(std::string_view label) const;
  // Unknown labels resolve to the "major" row, or 1.0 when the table has none.
  [[nodiscard]] double resolve(std::string_view label) const;
};

struct RewardRule {
  double value = 0.0;
  bool stable = false;
  std::string token;
};

struct DemeritRule {
  std::string severity;
  double value = 0.0;
};

struct PurusharthaCategory {
  std::string name;
  std::string description;
  double modifier = 1.0;
  std::vector<std::string> positive_actions;
  std::vector<std::string> negative_actions;
};

struct PositiveDistribution {
  double sanchita = 0.3;
  double prarabdha = 0.2;
  double dridha = 0.5;
  double adridha = 0.5;
};

struct RoleRung {
  std::string name;
  double threshold = 0.0;
};

struct KarmaConfig {
  SeverityTable demerit_severity;
  SeverityTable debt_severity;
  // Demerit tiers that have no debt tier of the same name.
  std::map<std::string, std::string> demerit_to_debt_tier;

  std::map<std::string, RewardRule> rewards;
  std::map<std::string, DemeritRule> demerits;
  std::array<PurusharthaCategory, kPurusharthaCount> purushartha;
  std::map<std::string, double> practice_weights;

  PositiveDistribution positive_distribution;
  double negative_adridha_fraction = 0.5;

  double default_reward_value = 5.0;
  PositiveDistribution default_distribution{0.3, 0.2, 0.4, 0.0};

  double net_weight_dridha = 0.8;
  double net_weight_adridha = 0.3;

  double merit_weight_dharma = 1.0;
  double merit_weight_seva = 1.2;
  double merit_weight_punya = 3.0;
  std::vector<RoleRung> roles;

  std::size_t ledger_trail_capacity = 10000;
  std::size_t ledger_write_retries = 2;
};

using ConfigPtr = std::shared_ptr<const KarmaConfig>;

KarmaConfig default_karma_config();

// Overrides `config` in place from a `key = value` profile file.
Result load_karma_config(std::string_view path, KarmaConfig& config);
Result apply_config_text(std::string_view text, KarmaConfig& config);

std::string_view purushartha_name(Purushartha category);
[[nodiscard]] double practice_weight(const KarmaConfig& config, std::string_view practice);

}  // namespace karma
