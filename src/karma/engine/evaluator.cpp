#include "karma/engine/evaluator.hpp"

#include <algorithm>
#include <utility>

namespace karma {

std::string_view action_class_name(ActionClass classification) {
  switch (classification) {
    case ActionClass::Merit:
      return "merit";
    case ActionClass::Demerit:
      return "demerit";
    case ActionClass::Default:
      return "default";
  }
  return "default";
}

KarmaEvaluator::KarmaEvaluator(ConfigPtr config)
    : config_(std::move(config)), guidance_(config_) {}

ActionEvaluation KarmaEvaluator::evaluate(const BalanceSheet& sheet, std::string_view action,
                                          double intensity) const {
  (void)sheet;

  ActionEvaluation out;
  out.action = std::string{action};
  out.intensity = intensity;

  const std::string key{action};
  if (const auto demerit = config_->demerits.find(key); demerit != config_->demerits.end()) {
    apply_demerit(demerit->second, out);
  } else if (const auto reward = config_->rewards.find(key); reward != config_->rewards.end()) {
    apply_reward(reward->second, out);
  } else {
    apply_default(out);
  }

  apply_purushartha(out);
  out.net_karma = (out.positive_impact - out.negative_impact) * intensity;
  out.corrective_recommendations = guidance_.for_evaluation(out);
  return out;
}

void KarmaEvaluator::apply_demerit(const DemeritRule& rule, ActionEvaluation& out) const {
  out.classification = ActionClass::Demerit;
  out.severity = rule.severity;
  out.negative_impact = rule.value * out.intensity;

  std::string debt_tier = rule.severity;
  if (const auto mapped = config_->demerit_to_debt_tier.find(rule.severity);
      mapped != config_->demerit_to_debt_tier.end()) {
    debt_tier = mapped->second;
  }
  out.rnanubandhan_delta = out.negative_impact * config_->debt_severity.resolve(debt_tier);
  out.adridha_delta = -out.negative_impact * config_->negative_adridha_fraction;
}

void KarmaEvaluator::apply_reward(const RewardRule& rule, ActionEvaluation& out) const {
  const PositiveDistribution& split = config_->positive_distribution;

  out.classification = ActionClass::Merit;
  out.positive_impact = rule.value * out.intensity;
  out.sanchita_delta = out.positive_impact * split.sanchita;
  out.prarabdha_delta = out.positive_impact * split.prarabdha;
  if (rule.stable) {
    out.dridha_delta = out.positive_impact * split.dridha;
  } else {
    out.adridha_delta = out.positive_impact * split.adridha;
  }
}

void KarmaEvaluator::apply_default(ActionEvaluation& out) const {
  const PositiveDistribution& split = config_->default_distribution;

  out.classification = ActionClass::Default;
  out.positive_impact = config_->default_reward_value * out.intensity;
  out.sanchita_delta = out.positive_impact * split.sanchita;
  out.prarabdha_delta = out.positive_impact * split.prarabdha;
  out.dridha_delta = out.positive_impact * split.dridha;
  out.adridha_delta = out.positive_impact * split.adridha;
}

void KarmaEvaluator::apply_purushartha(ActionEvaluation& out) const {
  for (std::size_t i = 0; i < kPurusharthaCount; ++i) {
    const PurusharthaCategory& category = config_->purushartha[i];
    if (std::ranges::find(category.positive_actions, out.action) !=
        category.positive_actions.end()) {
      out.purushartha[i] = category.modifier;
    } else if (std::ranges::find(category.negative_actions, out.action) !=
               category.negative_actions.end()) {
      out.purushartha[i] = -category.modifier;
    } else {
      out.purushartha[i] = 0.0;
    }
  }
}

}  // namespace karma
