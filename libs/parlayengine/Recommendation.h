// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RECOMMENDATION_H
#define __RECOMMENDATION_H 1

#include <map>
#include <string>
#include <vector>
#include "ParlayScoring.h"
#include "RecommendationCategory.h"
#include "GenerationSummary.h"

namespace parlayrec
{
  /**
   * @class Recommendation
   * @brief A ranked grouping returned to the caller.
   */
  class Recommendation
  {
  public:
    Recommendation(ScoredGrouping grouping,
		   RecommendationCategory category,
		   std::size_t rank)
      : mGrouping(std::move(grouping)),
	mCategory(category),
	mTypeLabel(typeLabel(category, mGrouping.getLegCount())),
	mRank(rank)
    {}

    const ScoredGrouping& getGrouping() const { return mGrouping; }
    RecommendationCategory getCategory() const { return mCategory; }

    /// e.g. "single bet", "2-leg parlay", "6-leg favorite parlay"
    const std::string& getTypeLabel() const { return mTypeLabel; }

    /// 1-based position within the category list
    std::size_t getRank() const { return mRank; }

    const std::vector<ResolvedOpportunity>& getLegs() const { return mGrouping.getLegs(); }
    double getCombinedDecimalOdds() const { return mGrouping.getCombinedDecimalOdds(); }
    const std::string& getAmericanOdds() const { return mGrouping.getAmericanOdds(); }
    double getWinProbabilityPercent() const { return mGrouping.getWinProbabilityPercent(); }
    double getExpectedValuePercent() const { return mGrouping.getExpectedValuePercent(); }
    double getCorrelationPenalty() const { return mGrouping.getCorrelationPenalty(); }
    const std::string& getCategoryTag() const { return mGrouping.getCategoryTag(); }

  private:
    ScoredGrouping mGrouping;
    RecommendationCategory mCategory;
    std::string mTypeLabel;
    std::size_t mRank;
  };

  struct CategoryResult
  {
    std::vector<Recommendation> recommendations;
    GenerationSummary summary;
  };

  /**
   * @class RecommendationSet
   * @brief One ordered list of recommendations per category.
   *
   * Every category is always present; an empty list is a valid outcome.
   */
  class RecommendationSet
  {
  public:
    RecommendationSet()
    {
      for (auto category : kAllCategories)
	mResults[category] = CategoryResult();
    }

    const std::vector<Recommendation>& getRecommendations(RecommendationCategory category) const
    {
      return mResults.at(category).recommendations;
    }

    const GenerationSummary& getSummary(RecommendationCategory category) const
    {
      return mResults.at(category).summary;
    }

    void setResult(RecommendationCategory category, CategoryResult result)
    {
      mResults[category] = std::move(result);
    }

    std::size_t getTotalRecommendations() const
    {
      std::size_t total = 0;
      for (const auto& entry : mResults)
	total += entry.second.recommendations.size();
      return total;
    }

    bool isEmpty() const
    {
      return getTotalRecommendations() == 0;
    }

    /// Category name -> list, the shape handed to presentation layers
    std::map<std::string, std::vector<Recommendation>> toNamedMap() const
    {
      std::map<std::string, std::vector<Recommendation>> named;
      for (const auto& [category, result] : mResults)
	named.emplace(categoryName(category), result.recommendations);
      return named;
    }

  private:
    std::map<RecommendationCategory, CategoryResult> mResults;
  };
}

#endif
