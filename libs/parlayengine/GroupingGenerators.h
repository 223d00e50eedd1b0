// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __GROUPING_GENERATORS_H
#define __GROUPING_GENERATORS_H 1

#include <cstddef>
#include <vector>
#include "CandidateEvaluator.h"
#include "CombinationSampler.h"
#include "Recommendation.h"
#include "RecommenderConfiguration.h"

namespace parlayrec
{
  namespace generators
  {
    /**
     * @brief Highest probability records first, truncated to the window.
     *
     * The sort is stable so records with equal probability keep caller order.
     * A window of 0 keeps the whole pool.
     */
    std::vector<ResolvedOpportunity> candidateWindow(const std::vector<ResolvedOpportunity>& pool,
						     std::size_t window);

    /// Descending expected value, stable.
    void rankByExpectedValue(std::vector<ScoredGrouping>& groupings);

    /**
     * @brief Descending combined probability, then drop every grouping whose
     *        set of labels was already seen. First occurrence wins.
     */
    void rankByProbabilityUnique(std::vector<ScoredGrouping>& groupings,
				 GenerationSummary& summary);

    /// Truncate to maxResults and wrap as 1-based ranked recommendations.
    CategoryResult makeCategoryResult(std::vector<ScoredGrouping> groupings,
				      RecommendationCategory category,
				      std::size_t maxResults,
				      GenerationSummary summary);

    /// Every resolved record is its own candidate. No correlation term.
    CategoryResult generateSingleBets(const std::vector<ResolvedOpportunity>& pool,
				      const CategoryThresholds& thresholds);

    /// Exhaustive i < j pairs over the window; pairs sharing a label are skipped.
    CategoryResult generateTwoLegParlays(const std::vector<ResolvedOpportunity>& pool,
					 const CategoryThresholds& thresholds);

    /**
     * @brief Up to maxAttempts independent draws of legCount records from the window.
     *
     * Draws that repeat an earlier draw are kept; deduplication is the
     * caller's choice. If the window is smaller than the leg count no draw is
     * made and the summary is flagged as an insufficient pool.
     */
    template <class Rng>
    std::vector<ScoredGrouping> sampleGroupings(const std::vector<ResolvedOpportunity>& window,
						const CategoryThresholds& thresholds,
						Rng& rng,
						GenerationSummary& summary)
    {
      std::vector<ScoredGrouping> accepted;

      if (thresholds.legCount == 0 || window.size() < thresholds.legCount)
	{
	  summary.setInsufficientPool(true);
	  return accepted;
	}

      CandidateEvaluator evaluator(thresholds);

      for (std::size_t attempt = 0; attempt < thresholds.maxAttempts; ++attempt)
	{
	  summary.incrementRandomDraws();

	  const auto indices = sampleWithoutReplacement(window.size(), thresholds.legCount, rng);

	  std::vector<ResolvedOpportunity> legs;
	  legs.reserve(indices.size());
	  for (auto index : indices)
	    legs.push_back(window[index]);

	  auto grouping = evaluator.consider(std::move(legs), summary);
	  if (grouping)
	    accepted.push_back(std::move(*grouping));
	}

      return accepted;
    }

    /// Random three-leg draws ranked by expected value.
    template <class Rng>
    CategoryResult generateThreeLegParlays(const std::vector<ResolvedOpportunity>& pool,
					   const CategoryThresholds& thresholds,
					   Rng& rng)
    {
      GenerationSummary summary;
      summary.setRecordsResolved(pool.size());

      const auto window = candidateWindow(pool, thresholds.candidateWindow);
      summary.setWindowSize(window.size());

      auto groupings = sampleGroupings(window, thresholds, rng, summary);
      rankByExpectedValue(groupings);

      return makeCategoryResult(std::move(groupings),
				RecommendationCategory::ThreeLegParlays,
				thresholds.maxResults,
				summary);
    }

    /// Random N-leg draws of the favorites, ranked by probability with unique label sets.
    template <class Rng>
    CategoryResult generateFavoriteParlays(const std::vector<ResolvedOpportunity>& pool,
					   const CategoryThresholds& thresholds,
					   Rng& rng)
    {
      GenerationSummary summary;
      summary.setRecordsResolved(pool.size());

      const auto window = candidateWindow(pool, thresholds.candidateWindow);
      summary.setWindowSize(window.size());

      auto groupings = sampleGroupings(window, thresholds, rng, summary);
      rankByProbabilityUnique(groupings, summary);

      return makeCategoryResult(std::move(groupings),
				RecommendationCategory::FavoriteParlays,
				thresholds.maxResults,
				summary);
    }
  }
}

#endif
