// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __CANDIDATE_EVALUATOR_H
#define __CANDIDATE_EVALUATOR_H 1

#include <optional>
#include <vector>
#include "GroupingReject.h"
#include "GenerationSummary.h"
#include "ParlayScoring.h"
#include "RecommenderConfiguration.h"

namespace parlayrec
{
  /**
   * @class CandidateEvaluator
   * @brief Scores candidate groupings and applies one category's thresholds.
   *
   * Both thresholds are inclusive: a grouping whose combined multiplier equals
   * minDecimalOdds is accepted.
   */
  class CandidateEvaluator
  {
  public:
    explicit CandidateEvaluator(const CategoryThresholds& thresholds)
      : mThresholds(thresholds)
    {}

    /**
     * @brief Reasons the scored grouping fails the thresholds.
     * @return GroupingReject::None when the grouping is acceptable
     */
    GroupingReject evaluate(const ScoredGrouping& grouping) const;

    /**
     * @brief Score the legs and return the grouping if it is acceptable.
     *
     * Legs sharing a display label are skipped without scoring. Every
     * outcome is recorded in the summary.
     */
    std::optional<ScoredGrouping> consider(std::vector<ResolvedOpportunity> legs,
					   GenerationSummary& summary) const;

    const CategoryThresholds& getThresholds() const
    {
      return mThresholds;
    }

  private:
    CategoryThresholds mThresholds;
  };
}

#endif
