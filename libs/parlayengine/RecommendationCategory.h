// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RECOMMENDATION_CATEGORY_H
#define __RECOMMENDATION_CATEGORY_H 1

#include <array>
#include <string>
#include <optional>
#include <cstddef>

namespace parlayrec
{
  enum class RecommendationCategory
    {
      SingleBets,
      TwoLegParlays,
      ThreeLegParlays,
      FavoriteParlays
    };

  inline constexpr std::array<RecommendationCategory, 4> kAllCategories =
    {
      RecommendationCategory::SingleBets,
      RecommendationCategory::TwoLegParlays,
      RecommendationCategory::ThreeLegParlays,
      RecommendationCategory::FavoriteParlays
    };

  /// Key used for the category in result sets and configuration files.
  inline std::string categoryName(RecommendationCategory category)
  {
    switch (category)
      {
      case RecommendationCategory::SingleBets:      return "single_bets";
      case RecommendationCategory::TwoLegParlays:   return "two_leg_parlays";
      case RecommendationCategory::ThreeLegParlays: return "three_leg_parlays";
      case RecommendationCategory::FavoriteParlays: return "favorite_parlays";
      }
    return "unknown";
  }

  inline std::optional<RecommendationCategory> categoryFromName(const std::string& name)
  {
    for (auto category : kAllCategories)
      {
	if (categoryName(category) == name)
	  return category;
      }
    return std::nullopt;
  }

  /// Human readable type label, e.g. "2-leg parlay" or "6-leg favorite parlay".
  inline std::string typeLabel(RecommendationCategory category, std::size_t legCount)
  {
    switch (category)
      {
      case RecommendationCategory::SingleBets:
	return "single bet";
      case RecommendationCategory::FavoriteParlays:
	return std::to_string(legCount) + "-leg favorite parlay";
      default:
	return std::to_string(legCount) + "-leg parlay";
      }
  }
}

#endif
