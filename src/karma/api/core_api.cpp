#include "karma/api/core_api.hpp"

#include <filesystem>
#include <utility>

#include "karma/util/canonical.hpp"

namespace karma {

CoreApi::CoreApi()
    : config_(std::make_shared<const KarmaConfig>(default_karma_config())),
      engines_(std::make_unique<Engines>(config_)) {}

Result CoreApi::load_config(const InitConfig& config) {
  KarmaConfig loaded = default_karma_config();
  std::string message = "Using built-in karma tables.";
  if (!config.config_path.empty()) {
    const Result applied = load_karma_config(config.config_path, loaded);
    if (!applied.ok) {
      return applied;
    }
    message = applied.message;
  }

  config_ = std::make_shared<const KarmaConfig>(std::move(loaded));
  engines_ = std::make_unique<Engines>(config_);
  return Result::success(std::move(message));
}

Result CoreApi::init(const InitConfig& config) {
  if (ledger_.is_open()) {
    return Result::failure("Init failed: ledger is already open.");
  }
  if (config.app_data_dir.empty()) {
    return Result::failure("Init failed: app_data_dir is required.");
  }

  const Result loaded = load_config(config);
  if (!loaded.ok) {
    return Result::failure("Init failed: " + loaded.message);
  }

  LedgerOptions options;
  options.data_dir = (std::filesystem::path{config.app_data_dir} / "ledger").string();
  options.trail_capacity = config_->ledger_trail_capacity;
  options.write_retries = config_->ledger_write_retries;
  options.resume_chain = config.resume_chain;

  const Result opened = ledger_.open(options);
  if (!opened.ok) {
    return Result::failure("Init failed: " + opened.message);
  }
  return Result::success(loaded.message + " " + opened.message);
}

Result CoreApi::init(const InitConfig& config, std::unique_ptr<LedgerSink> sink) {
  if (ledger_.is_open()) {
    return Result::failure("Init failed: ledger is already open.");
  }
  const Result loaded = load_config(config);
  if (!loaded.ok) {
    return Result::failure("Init failed: " + loaded.message);
  }

  LedgerOptions options;
  if (!config.app_data_dir.empty()) {
    options.data_dir = (std::filesystem::path{config.app_data_dir} / "ledger").string();
  }
  options.trail_capacity = config_->ledger_trail_capacity;
  options.write_retries = config_->ledger_write_retries;
  options.resume_chain = config.resume_chain;

  const Result opened = ledger_.open(options, std::move(sink));
  if (!opened.ok) {
    return Result::failure("Init failed: " + opened.message);
  }
  return Result::success(loaded.message + " " + opened.message);
}

ActionEvaluation CoreApi::evaluate(const BalanceSheet& sheet, std::string_view action,
                                   double intensity) const {
  return engines_->evaluator.evaluate(sheet, action, intensity);
}

NetKarma CoreApi::net_karma(const BalanceSheet& sheet) const {
  return engines_->aggregator.aggregate(sheet);
}

std::vector<CorrectiveRecommendation> CoreApi::corrective_guidance(
    const BalanceSheet& sheet) const {
  return corrective_guidance(sheet, engines_->aggregator.default_signals(sheet));
}

std::vector<CorrectiveRecommendation> CoreApi::corrective_guidance(
    const BalanceSheet& sheet, const GuidanceSignals& signals) const {
  return engines_->guidance.for_sheet(sheet, engines_->aggregator.aggregate(sheet), signals);
}

RewardAdjustment CoreApi::adapt_reward(const BalanceSheet& sheet, std::string_view action,
                                       double base_reward) const {
  return engines_->rewards.adapt(sheet, action, base_reward);
}

PurusharthaVector CoreApi::purushartha_score(const BalanceSheet& sheet) const {
  return engines_->aggregator.purushartha_score(sheet);
}

StabilityProfile CoreApi::stability_profile(const BalanceSheet& sheet) const {
  return engines_->aggregator.stability_profile(sheet);
}

DebtLedger CoreApi::debt_ledger(const BalanceSheet& sheet) const {
  return engines_->aggregator.debt_ledger(sheet);
}

ActionLogOutcome CoreApi::log_action(const BalanceSheet& sheet, const KarmaActionDraft& draft) {
  ActionLogOutcome outcome;
  outcome.evaluation = evaluate(sheet, draft.action, draft.intensity);

  const ActionEvaluation& evaluation = outcome.evaluation;
  Fields additional{
      {"classification", std::string{action_class_name(evaluation.classification)}},
      {"intensity", util::format_number(evaluation.intensity)},
      {"positive_impact", util::format_number(evaluation.positive_impact)},
      {"negative_impact", util::format_number(evaluation.negative_impact)},
      {"rnanubandhan_delta", util::format_number(evaluation.rnanubandhan_delta)},
  };
  if (!evaluation.severity.empty()) {
    additional.emplace_back("severity", evaluation.severity);
  }

  outcome.ledger = ledger_.log_karma_action(draft.request_id, draft.user_id, draft.action,
                                            evaluation.net_karma, draft.role, draft.intent,
                                            additional, draft.session_id);
  return outcome;
}

}  // namespace karma
