#include "karma/engine/aggregator.hpp"

#include <utility>

#include "karma/engine/balance_sheet.hpp"

namespace karma {

double DefaultKarmaWeighting::weighted_score(const BalanceSheet& sheet) const {
  double raw_debt = 0.0;
  for (const auto& record : normalize_debt(sheet)) {
    raw_debt += record.amount;
  }

  return scalar_balance(sheet, kDridhaKarma) * 0.8 + scalar_balance(sheet, kAdridhaKarma) * 0.3 +
         scalar_balance(sheet, kSanchitaKarma) + scalar_balance(sheet, kPrarabdhaKarma) -
         raw_debt;
}

NetKarmaAggregator::NetKarmaAggregator(ConfigPtr config,
                                       std::shared_ptr<const KarmaWeighting> weighting)
    : config_(std::move(config)), weighting_(std::move(weighting)) {
  if (!weighting_) {
    weighting_ = std::make_shared<DefaultKarmaWeighting>();
  }
}

NetKarma NetKarmaAggregator::aggregate(const BalanceSheet& sheet) const {
  NetKarma out;
  KarmaBreakdown& parts = out.breakdown;

  parts.positive_karma = scalar_balance(sheet, kDharmaPoints) +
                         scalar_balance(sheet, kSevaPoints) + scalar_balance(sheet, kPunyaTokens);
  for (const auto& record : tiered_balance(sheet, kPaapTokens)) {
    parts.negative_karma += record.amount * config_->demerit_severity.resolve(record.severity);
  }

  parts.dridha_karma = scalar_balance(sheet, kDridhaKarma);
  parts.adridha_karma = scalar_balance(sheet, kAdridhaKarma);
  parts.sanchita_karma = scalar_balance(sheet, kSanchitaKarma);
  parts.prarabdha_karma = scalar_balance(sheet, kPrarabdhaKarma);
  parts.rnanubandhan = debt_ledger(sheet).total_debt;

  out.net_karma = parts.positive_karma - parts.negative_karma +
                  parts.dridha_karma * config_->net_weight_dridha +
                  parts.adridha_karma * config_->net_weight_adridha + parts.sanchita_karma +
                  parts.prarabdha_karma - parts.rnanubandhan;
  out.weighted_score = weighting_->weighted_score(sheet);
  return out;
}

PurusharthaVector NetKarmaAggregator::purushartha_score(const BalanceSheet& sheet) const {
  const double dharma = scalar_balance(sheet, kDharmaPoints);
  const double seva = scalar_balance(sheet, kSevaPoints);
  const double punya = scalar_balance(sheet, kPunyaTokens);

  PurusharthaVector scores{
      dharma + seva * 0.5,
      seva * 0.3 + punya * 0.2,
      seva * 0.4 + dharma * 0.2,
      dharma * 1.2 + punya * 0.8,
  };
  for (std::size_t i = 0; i < kPurusharthaCount; ++i) {
    scores[i] *= config_->purushartha[i].modifier;
  }
  return scores;
}

StabilityProfile NetKarmaAggregator::stability_profile(const BalanceSheet& sheet) const {
  StabilityProfile profile;
  const double dridha = scalar_balance(sheet, kDridhaKarma);
  const double adridha = scalar_balance(sheet, kAdridhaKarma);
  profile.total = dridha + adridha;
  if (profile.total != 0.0) {
    profile.dridha_ratio = dridha / profile.total;
    profile.adridha_ratio = adridha / profile.total;
  }
  return profile;
}

DebtLedger NetKarmaAggregator::debt_ledger(const BalanceSheet& sheet) const {
  DebtLedger ledger;
  for (const auto& record : normalize_debt(sheet)) {
    const double weighted = record.amount * config_->debt_severity.resolve(record.severity);
    DebtTier& tier = ledger.severity_breakdown[record.severity];
    tier.amount += record.amount;
    tier.weighted_amount += weighted;
    ledger.total_debt += weighted;
    ++ledger.obligations;
  }
  return ledger;
}

GuidanceSignals NetKarmaAggregator::default_signals(const BalanceSheet& sheet) const {
  return GuidanceSignals{stability_profile(sheet).dridha_ratio, debt_ledger(sheet).total_debt};
}

}  // namespace karma
