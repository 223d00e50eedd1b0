// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PARLAY_SCORING_H
#define __PARLAY_SCORING_H 1

#include <string>
#include <vector>
#include "Opportunity.h"

namespace parlayrec
{
  /**
   * @class ScoredGrouping
   * @brief A candidate grouping together with its derived odds, probability and EV.
   *
   * The combined probability is kept as a fraction; callers that present it
   * use getWinProbabilityPercent().
   */
  class ScoredGrouping
  {
  public:
    ScoredGrouping(std::vector<ResolvedOpportunity> legs,
		   double combinedDecimalOdds,
		   double correlationPenalty,
		   double combinedProbability,
		   double expectedValuePercent,
		   std::string categoryTag,
		   std::string americanOdds)
      : mLegs(std::move(legs)),
	mCombinedDecimalOdds(combinedDecimalOdds),
	mCorrelationPenalty(correlationPenalty),
	mCombinedProbability(combinedProbability),
	mExpectedValuePercent(expectedValuePercent),
	mCategoryTag(std::move(categoryTag)),
	mAmericanOdds(std::move(americanOdds))
    {}

    const std::vector<ResolvedOpportunity>& getLegs() const { return mLegs; }
    std::size_t getLegCount() const { return mLegs.size(); }
    double getCombinedDecimalOdds() const { return mCombinedDecimalOdds; }
    double getCorrelationPenalty() const { return mCorrelationPenalty; }
    double getCombinedProbability() const { return mCombinedProbability; }
    double getWinProbabilityPercent() const { return mCombinedProbability * 100.0; }
    double getExpectedValuePercent() const { return mExpectedValuePercent; }
    const std::string& getCategoryTag() const { return mCategoryTag; }
    const std::string& getAmericanOdds() const { return mAmericanOdds; }

  private:
    std::vector<ResolvedOpportunity> mLegs;
    double mCombinedDecimalOdds;
    double mCorrelationPenalty;
    double mCombinedProbability;
    double mExpectedValuePercent;
    std::string mCategoryTag;
    std::string mAmericanOdds;
  };

  namespace scoring
  {
    /// Tag reported for a grouping whose legs come from more than one category.
    inline const std::string kMixedCategoryTag = "Mixed";

    /// Exact product of the leg multipliers. No rounding is applied.
    double combinedDecimalOdds(const std::vector<ResolvedOpportunity>& legs);

    /**
     * @brief Correlation penalty for legs that share a category tag.
     *
     * Every tag that appears n > 1 times contributes (n - 1) * increment.
     * Two legs from the same sport with increment 0.05 give 0.05; four legs
     * from one sport with increment 0.03 give 0.09.
     */
    double correlationPenalty(const std::vector<ResolvedOpportunity>& legs, double increment);

    /**
     * @brief Product of the leg probabilities with the penalty applied as a haircut.
     *
     * The result is not clamped. A penalty of 1 or more yields zero or a
     * negative value; RecommenderConfiguration::validate() reports increments
     * that make this reachable.
     */
    double combinedProbability(const std::vector<ResolvedOpportunity>& legs, double penalty);

    /// (decimalOdds * probability - 1) * 100, the percent return on a unit stake
    double expectedValuePercent(double decimalOdds, double probability);

    bool hasDuplicateLabel(const std::vector<ResolvedOpportunity>& legs);

    /// The shared category tag, or kMixedCategoryTag when the legs differ
    std::string groupingCategoryTag(const std::vector<ResolvedOpportunity>& legs);

    /**
     * @brief Score a grouping.
     * @throws std::invalid_argument if legs is empty
     */
    ScoredGrouping scoreGrouping(std::vector<ResolvedOpportunity> legs, double correlationIncrement);
  }
}

#endif
