#include "karma/engine/guidance.hpp"

#include <algorithm>
#include <utility>

#include "karma/engine/balance_sheet.hpp"

namespace karma {

std::string_view urgency_name(Urgency urgency) {
  switch (urgency) {
    case Urgency::High:
      return "high";
    case Urgency::Medium:
      return "medium";
    case Urgency::Low:
      return "low";
  }
  return "low";
}

CorrectiveGuidance::CorrectiveGuidance(ConfigPtr config) : config_(std::move(config)) {}

void CorrectiveGuidance::add(std::vector<CorrectiveRecommendation>& out, std::string_view practice,
                             std::string_view reason, Urgency urgency) const {
  // Practices without a configured weight are not recommended.
  const auto it = config_->practice_weights.find(std::string{practice});
  if (it == config_->practice_weights.end()) {
    return;
  }
  out.push_back(CorrectiveRecommendation{std::string{practice}, std::string{reason}, urgency,
                                         it->second});
}

std::vector<CorrectiveRecommendation> CorrectiveGuidance::for_evaluation(
    const ActionEvaluation& evaluation) const {
  std::vector<CorrectiveRecommendation> out;

  if (evaluation.negative_impact > 10.0) {
    add(out, "Tap", "High negative karma requires austerity to balance", Urgency::High);
  }
  if (evaluation.positive_impact < 5.0) {
    add(out, "Seva", "Increase positive karma through selfless service", Urgency::Medium);
  }
  if (evaluation.purushartha[static_cast<std::size_t>(Purushartha::Kama)] < 0.0) {
    add(out, "Meditation", "Balance desires through mindfulness practice", Urgency::Medium);
  }
  if (evaluation.positive_impact > 15.0) {
    add(out, "Bhakti", "Channel positive energy into devotional practice", Urgency::Low);
  }

  rank(out);
  return out;
}

std::vector<CorrectiveRecommendation> CorrectiveGuidance::for_sheet(
    const BalanceSheet& sheet, const NetKarma& net, const GuidanceSignals& signals) const {
  std::vector<CorrectiveRecommendation> out;

  if (net.net_karma < 0.0) {
    add(out, "Seva", "Overall negative karma balance, focus on selfless service", Urgency::High);
  }

  double total_paap = 0.0;
  for (const auto& record : tiered_balance(sheet, kPaapTokens)) {
    total_paap += record.amount;
  }
  if (total_paap > 20.0) {
    add(out, "Tap", "High accumulation of negative actions, practice austerity", Urgency::High);
  }

  if (scalar_balance(sheet, kDharmaPoints) < 10.0) {
    add(out, "Meditation", "Low dharmic foundation, strengthen through meditation",
        Urgency::Medium);
  }
  if (scalar_balance(sheet, kSevaPoints) < 15.0) {
    add(out, "Seva", "Insufficient service to others, increase seva activities", Urgency::Medium);
  }
  if (scalar_balance(sheet, kPunyaTokens) > 50.0) {
    add(out, "Bhakti", "Strong positive karma foundation, channel into devotional practice",
        Urgency::Low);
  }

  if (signals.dridha_ratio < 0.3) {
    add(out, "Daily Practice",
        "Unstable karma patterns detected, establish daily spiritual practices", Urgency::High);
  } else if (signals.dridha_ratio > 0.7) {
    add(out, "Advanced Practice",
        "Stable karma patterns detected, ready for advanced spiritual practices",
        Urgency::Medium);
  }

  if (signals.total_debt > 30.0) {
    add(out, "Atonement", "Significant karmic debt detected, prioritize atonement practices",
        Urgency::High);
  }

  rank(out);
  return out;
}

void CorrectiveGuidance::rank(std::vector<CorrectiveRecommendation>& recommendations) {
  std::ranges::stable_sort(recommendations, [](const CorrectiveRecommendation& lhs,
                                               const CorrectiveRecommendation& rhs) {
    if (lhs.weight != rhs.weight) {
      return lhs.weight > rhs.weight;
    }
    return static_cast<int>(lhs.urgency) > static_cast<int>(rhs.urgency);
  });
}

}  // namespace karma
