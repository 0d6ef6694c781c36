#include "karma/config/tables.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "karma/util/canonical.hpp"

namespace karma {
namespace {

std::optional<Purushartha> purushartha_from_name(std::string_view name) {
  const std::string lowered = util::lowercase_copy(name);
  if (lowered == "dharma") {
    return Purushartha::Dharma;
  }
  if (lowered == "artha") {
    return Purushartha::Artha;
  }
  if (lowered == "kama") {
    return Purushartha::Kama;
  }
  if (lowered == "moksha") {
    return Purushartha::Moksha;
  }
  return std::nullopt;
}

// Splits "prefix.rest" at the first dot.
std::pair<std::string, std::string> split_key(std::string_view key) {
  const auto dot = key.find('.');
  if (dot == std::string_view::npos) {
    return {std::string{key}, {}};
  }
  return {std::string{key.substr(0, dot)}, std::string{key.substr(dot + 1)}};
}

class ConfigReader {
public:
  explicit ConfigReader(KarmaConfig& config) : config_(config) {}

  void apply(const std::string& key, const std::string& value) {
    const auto [section, name] = split_key(key);
    if (name.empty()) {
      warn(key, "missing section name");
      return;
    }

    if (section == "demerit_severity") {
      set_entry(key, value, config_.demerit_severity.multipliers, name);
    } else if (section == "debt_severity") {
      set_entry(key, value, config_.debt_severity.multipliers, name);
    } else if (section == "debt_tier") {
      config_.demerit_to_debt_tier[name] = value;
    } else if (section == "reward") {
      apply_reward(key, name, value);
    } else if (section == "demerit") {
      apply_demerit(key, name, value);
    } else if (section == "purushartha") {
      apply_purushartha(key, name, value);
    } else if (section == "guidance") {
      set_entry(key, value, config_.practice_weights, name);
    } else if (section == "positive_distribution") {
      apply_distribution(key, name, value, config_.positive_distribution);
    } else if (section == "default_distribution") {
      apply_distribution(key, name, value, config_.default_distribution);
    } else if (section == "negative_distribution" && name == "adridha") {
      set_number(key, value, config_.negative_adridha_fraction);
    } else if (section == "default_reward" && name == "value") {
      set_number(key, value, config_.default_reward_value);
    } else if (section == "net_weight" && name == "dridha") {
      set_number(key, value, config_.net_weight_dridha);
    } else if (section == "net_weight" && name == "adridha") {
      set_number(key, value, config_.net_weight_adridha);
    } else if (section == "merit_weight" && name == "dharma") {
      set_number(key, value, config_.merit_weight_dharma);
    } else if (section == "merit_weight" && name == "seva") {
      set_number(key, value, config_.merit_weight_seva);
    } else if (section == "merit_weight" && name == "punya") {
      set_number(key, value, config_.merit_weight_punya);
    } else if (section == "role") {
      apply_role(key, name, value);
    } else if (section == "ledger" && name == "trail_capacity") {
      set_count(key, value, config_.ledger_trail_capacity, 1);
    } else if (section == "ledger" && name == "write_retries") {
      set_count(key, value, config_.ledger_write_retries, 0);
    } else {
      warn(key, "unknown key");
    }
  }

  void finish() {
    if (file_roles_.empty()) {
      return;
    }
    std::ranges::stable_sort(file_roles_, [](const RoleRung& lhs, const RoleRung& rhs) {
      return lhs.threshold < rhs.threshold;
    });
    config_.roles = std::move(file_roles_);
  }

  [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }

private:
  void warn(std::string_view key, std::string_view reason) {
    warnings_.push_back(std::string{key} + ": " + std::string{reason});
  }

  void set_number(std::string_view key, std::string_view value, double& target) {
    const auto parsed = util::parse_double(value);
    if (!parsed) {
      warn(key, "not a number, default kept");
      return;
    }
    target = *parsed;
  }

  void set_entry(std::string_view key, std::string_view value, std::map<std::string, double>& table,
                 const std::string& name) {
    const auto parsed = util::parse_double(value);
    if (!parsed) {
      warn(key, "not a number, entry ignored");
      return;
    }
    table[name] = *parsed;
  }

  void set_count(std::string_view key, std::string_view value, std::size_t& target,
                 std::size_t minimum) {
    const auto parsed = util::parse_uint64(util::trim_copy(value));
    if (!parsed || *parsed < minimum) {
      warn(key, "not a valid count, default kept");
      return;
    }
    target = static_cast<std::size_t>(*parsed);
  }

  void apply_reward(std::string_view key, const std::string& action, std::string_view value) {
    const auto parts = util::split_list(value);
    if (parts.empty()) {
      warn(key, "empty reward rule");
      return;
    }
    const auto parsed = util::parse_double(parts.front());
    if (!parsed) {
      warn(key, "reward value is not a number");
      return;
    }

    RewardRule rule;
    rule.value = *parsed;
    for (std::size_t i = 1; i < parts.size(); ++i) {
      if (util::lowercase_copy(parts[i]) == "stable") {
        rule.stable = true;
      } else {
        rule.token = parts[i];
      }
    }
    config_.rewards[action] = std::move(rule);
  }

  void apply_demerit(std::string_view key, const std::string& action, std::string_view value) {
    const auto parts = util::split_list(value);
    if (parts.size() != 2) {
      warn(key, "expected '<tier>, <value>'");
      return;
    }
    const auto parsed = util::parse_double(parts[1]);
    if (!parsed) {
      warn(key, "demerit value is not a number");
      return;
    }
    config_.demerits[action] = DemeritRule{parts[0], *parsed};
  }

  void apply_purushartha(std::string_view key, std::string_view name, std::string_view value) {
    const auto [category_name, field] = split_key(name);
    const auto category = purushartha_from_name(category_name);
    if (!category) {
      warn(key, "unknown purushartha category");
      return;
    }

    PurusharthaCategory& target = config_.purushartha[static_cast<std::size_t>(*category)];
    if (field == "modifier") {
      set_number(key, value, target.modifier);
    } else if (field == "positive") {
      target.positive_actions = util::split_list(value);
    } else if (field == "negative") {
      target.negative_actions = util::split_list(value);
    } else if (field == "description") {
      target.description = std::string{value};
    } else {
      warn(key, "unknown purushartha field");
    }
  }

  void apply_distribution(std::string_view key, std::string_view name, std::string_view value,
                          PositiveDistribution& target) {
    if (name == "sanchita") {
      set_number(key, value, target.sanchita);
    } else if (name == "prarabdha") {
      set_number(key, value, target.prarabdha);
    } else if (name == "dridha") {
      set_number(key, value, target.dridha);
    } else if (name == "adridha") {
      set_number(key, value, target.adridha);
    } else {
      warn(key, "unknown distribution bucket");
    }
  }

  void apply_role(std::string_view key, const std::string& name, std::string_view value) {
    const auto parsed = util::parse_double(value);
    if (!parsed) {
      warn(key, "role threshold is not a number");
      return;
    }
    file_roles_.push_back(RoleRung{name, *parsed});
  }

  KarmaConfig& config_;
  std::vector<RoleRung> file_roles_;
  std::vector<std::string> warnings_;
};

}  // namespace

std::optional<double> SeverityTable::find(std::string_view label) const {
  const auto it = multipliers.find(std::string{label});
  if (it == multipliers.end()) {
    return std::nullopt;
  }
  return it->second;
}

double SeverityTable::resolve(std::string_view label) const {
  if (const auto direct = find(label)) {
    return *direct;
  }
  if (const auto fallback = find(kFallbackSeverity)) {
    return *fallback;
  }
  return 1.0;
}

KarmaConfig default_karma_config() {
  KarmaConfig config;

  config.demerit_severity.multipliers = {
      {"minor", 1.0},
      {"medium", 2.5},
      {"maha", 5.0},
  };
  config.debt_severity.multipliers = {
      {"minor", 1.0},
      {"medium", 2.0},
      {"major", 4.0},
  };
  config.demerit_to_debt_tier = {{"maha", "major"}};

  config.rewards = {
      {"completing_lessons", {5.0, true, "DharmaPoints"}},
      {"helping_peers", {10.0, false, "SevaPoints"}},
      {"solving_doubts", {8.0, false, "SevaPoints"}},
      {"selfless_service", {25.0, true, "PunyaTokens"}},
      {"mentor_newcomers", {30.0, false, "PunyaTokens"}},
      {"ethical_coding", {15.0, false, "DharmaPoints"}},
      {"knowledge_sharing", {12.0, false, "SevaPoints"}},
  };

  config.demerits = {
      {"cheat", {"minor", 10.0}},
      {"break_promise", {"minor", 5.0}},
      {"false_speech", {"minor", 8.0}},
      {"disrespect_guru", {"medium", 15.0}},
      {"theft", {"medium", 30.0}},
      {"harm_others", {"medium", 25.0}},
      {"violence", {"maha", 50.0}},
  };

  config.purushartha = {{
      {"Dharma",
       "Righteousness, duty, and moral virtue",
       1.2,
       {"completing_lessons", "helping_peers", "solving_doubts"},
       {"cheat", "disrespect_guru", "break_promise", "false_speech"}},
      {"Artha",
       "Wealth, prosperity, and economic values",
       1.0,
       {"selfless_service"},
       {"theft", "violence"}},
      {"Kama",
       "Desire, pleasure, and emotional fulfillment",
       0.8,
       {"helping_peers", "solving_doubts"},
       {"harm_others", "violence"}},
      {"Moksha",
       "Liberation, spiritual freedom, and enlightenment",
       1.5,
       {"selfless_service", "completing_lessons"},
       {"cheat", "disrespect_guru"}},
  }};

  config.practice_weights = {
      {"Seva", 1.2},
      {"Meditation", 1.1},
      {"Daan", 1.0},
      {"Tap", 1.4},
      {"Bhakti", 1.3},
      {"Daily Practice", 1.6},
      {"Advanced Practice", 1.5},
      {"Atonement", 1.7},
  };

  config.roles = {
      {"learner", 0.0},
      {"volunteer", 50.0},
      {"mentor", 150.0},
      {"guru", 300.0},
  };

  return config;
}

Result apply_config_text(std::string_view text, KarmaConfig& config) {
  ConfigReader reader(config);

  std::istringstream in{std::string{text}};
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      continue;
    }

    const std::string key = util::trim_copy(trimmed.substr(0, split));
    const std::string value = util::trim_copy(trimmed.substr(split + 1));
    reader.apply(key, value);
  }
  reader.finish();

  if (reader.warnings().empty()) {
    return Result::success("Karma config applied.");
  }

  std::string details = "Karma config applied with " + std::to_string(reader.warnings().size()) +
                        " ignored entr" + (reader.warnings().size() == 1 ? "y" : "ies") + ":";
  for (const auto& warning : reader.warnings()) {
    details += "\n  " + warning;
  }
  return Result::success(std::move(details));
}

Result load_karma_config(std::string_view path, KarmaConfig& config) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure("Karma config not readable: " + std::string{path});
  }

  std::ostringstream contents;
  contents << in.rdbuf();
  return apply_config_text(contents.str(), config);
}

std::string_view purushartha_name(Purushartha category) {
  switch (category) {
    case Purushartha::Dharma:
      return "Dharma";
    case Purushartha::Artha:
      return "Artha";
    case Purushartha::Kama:
      return "Kama";
    case Purushartha::Moksha:
      return "Moksha";
  }
  return "Dharma";
}

double practice_weight(const KarmaConfig& config, std::string_view practice) {
  const auto it = config.practice_weights.find(std::string{practice});
  return it == config.practice_weights.end() ? 0.0 : it->second;
}

}  // namespace karma
