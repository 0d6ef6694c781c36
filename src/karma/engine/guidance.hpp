#pragma once

#include <string_view>
#include <vector>

#include "karma/config/tables.hpp"
#include "karma/model/types.hpp"

namespace karma {

std::string_view urgency_name(Urgency urgency);

class CorrectiveGuidance {
public:
  explicit CorrectiveGuidance(ConfigPtr config);

  // Rules applied to a single action evaluation.
  [[nodiscard]] std::vector<CorrectiveRecommendation> for_evaluation(
      const ActionEvaluation& evaluation) const;

  // Rules applied to a user's whole balance sheet. `net` and `signals` come from the
  // aggregator so the recommender never re-derives them.
  [[nodiscard]] std::vector<CorrectiveRecommendation> for_sheet(const BalanceSheet& sheet,
                                                                const NetKarma& net,
                                                                const GuidanceSignals& signals) const;

  // Weight descending, then urgency descending; ties keep insertion order.
  static void rank(std::vector<CorrectiveRecommendation>& recommendations);

private:
  void add(std::vector<CorrectiveRecommendation>& out, std::string_view practice,
           std::string_view reason, Urgency urgency) const;

  ConfigPtr config_;
};

}  // namespace karma
