// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "CandidateEvaluator.h"

namespace parlayrec
{
  GroupingReject CandidateEvaluator::evaluate(const ScoredGrouping& grouping) const
  {
    GroupingReject mask = GroupingReject::None;

    if (grouping.getCombinedDecimalOdds() < mThresholds.minDecimalOdds)
      mask |= GroupingReject::BelowMinOdds;

    if (grouping.getWinProbabilityPercent() < mThresholds.minWinProbabilityPercent)
      mask |= GroupingReject::BelowMinProbability;

    return mask;
  }

  std::optional<ScoredGrouping>
  CandidateEvaluator::consider(std::vector<ResolvedOpportunity> legs,
			       GenerationSummary& summary) const
  {
    if (scoring::hasDuplicateLabel(legs))
      {
	summary.recordRejection(GroupingReject::DuplicateLabel);
	return std::nullopt;
      }

    summary.incrementCandidatesEvaluated();

    ScoredGrouping grouping = scoring::scoreGrouping(std::move(legs),
						     mThresholds.correlationIncrement);

    const GroupingReject mask = evaluate(grouping);
    if (mask != GroupingReject::None)
      {
	summary.recordRejection(mask);
	return std::nullopt;
      }

    summary.incrementAcceptedCount();
    return grouping;
  }
}
