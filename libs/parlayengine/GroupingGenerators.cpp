// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "GroupingGenerators.h"
#include <algorithm>
#include <set>
#include <string>

namespace parlayrec
{
  namespace generators
  {
    std::vector<ResolvedOpportunity> candidateWindow(const std::vector<ResolvedOpportunity>& pool,
						     std::size_t window)
    {
      std::vector<ResolvedOpportunity> sorted(pool);
      std::stable_sort(sorted.begin(), sorted.end(), higherProbability);

      if (window != 0 && sorted.size() > window)
	sorted.erase(sorted.begin() + window, sorted.end());

      return sorted;
    }

    void rankByExpectedValue(std::vector<ScoredGrouping>& groupings)
    {
      std::stable_sort(groupings.begin(), groupings.end(),
		       [](const ScoredGrouping& lhs, const ScoredGrouping& rhs) {
			 return lhs.getExpectedValuePercent() > rhs.getExpectedValuePercent();
		       });
    }

    void rankByProbabilityUnique(std::vector<ScoredGrouping>& groupings,
				 GenerationSummary& summary)
    {
      std::stable_sort(groupings.begin(), groupings.end(),
		       [](const ScoredGrouping& lhs, const ScoredGrouping& rhs) {
			 return lhs.getCombinedProbability() > rhs.getCombinedProbability();
		       });

      std::set<std::set<std::string>> seenLabelSets;
      std::vector<ScoredGrouping> unique;
      unique.reserve(groupings.size());

      for (auto& grouping : groupings)
	{
	  std::set<std::string> labels;
	  for (const auto& leg : grouping.getLegs())
	    labels.insert(leg.getLabel());

	  if (seenLabelSets.insert(std::move(labels)).second)
	    unique.push_back(std::move(grouping));
	  else
	    summary.recordRejection(GroupingReject::DuplicateLabelSet);
	}

      groupings = std::move(unique);
    }

    CategoryResult makeCategoryResult(std::vector<ScoredGrouping> groupings,
				      RecommendationCategory category,
				      std::size_t maxResults,
				      GenerationSummary summary)
    {
      CategoryResult result;
      result.summary = summary;

      const std::size_t count = std::min(maxResults, groupings.size());
      result.recommendations.reserve(count);

      for (std::size_t i = 0; i < count; ++i)
	result.recommendations.emplace_back(std::move(groupings[i]), category, i + 1);

      return result;
    }

    CategoryResult generateSingleBets(const std::vector<ResolvedOpportunity>& pool,
				      const CategoryThresholds& thresholds)
    {
      GenerationSummary summary;
      summary.setRecordsResolved(pool.size());

      const auto window = candidateWindow(pool, thresholds.candidateWindow);
      summary.setWindowSize(window.size());

      CandidateEvaluator evaluator(thresholds);
      std::vector<ScoredGrouping> accepted;

      for (const auto& opportunity : window)
	{
	  auto grouping = evaluator.consider({opportunity}, summary);
	  if (grouping)
	    accepted.push_back(std::move(*grouping));
	}

      rankByExpectedValue(accepted);
      return makeCategoryResult(std::move(accepted),
				RecommendationCategory::SingleBets,
				thresholds.maxResults,
				summary);
    }

    CategoryResult generateTwoLegParlays(const std::vector<ResolvedOpportunity>& pool,
					 const CategoryThresholds& thresholds)
    {
      GenerationSummary summary;
      summary.setRecordsResolved(pool.size());

      const auto window = candidateWindow(pool, thresholds.candidateWindow);
      summary.setWindowSize(window.size());

      std::vector<ScoredGrouping> accepted;
      if (window.size() < 2)
	{
	  summary.setInsufficientPool(true);
	  return makeCategoryResult(std::move(accepted),
				    RecommendationCategory::TwoLegParlays,
				    thresholds.maxResults,
				    summary);
	}

      CandidateEvaluator evaluator(thresholds);

      for (std::size_t i = 0; i < window.size(); ++i)
	{
	  for (std::size_t j = i + 1; j < window.size(); ++j)
	    {
	      auto grouping = evaluator.consider({window[i], window[j]}, summary);
	      if (grouping)
		accepted.push_back(std::move(*grouping));
	    }
	}

      rankByExpectedValue(accepted);
      return makeCategoryResult(std::move(accepted),
				RecommendationCategory::TwoLegParlays,
				thresholds.maxResults,
				summary);
    }
  }
}
