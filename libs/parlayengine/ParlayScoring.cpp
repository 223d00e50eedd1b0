// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "ParlayScoring.h"
#include <map>
#include <set>
#include <stdexcept>
#include "OddsConversion.h"

namespace parlayrec
{
  namespace scoring
  {
    double combinedDecimalOdds(const std::vector<ResolvedOpportunity>& legs)
    {
      double product = 1.0;
      for (const auto& leg : legs)
	product *= leg.getDecimalOdds();

      return product;
    }

    double correlationPenalty(const std::vector<ResolvedOpportunity>& legs, double increment)
    {
      std::map<std::string, std::size_t> tagCounts;
      for (const auto& leg : legs)
	tagCounts[leg.getCategoryTag()]++;

      double penalty = 0.0;
      for (const auto& [tag, count] : tagCounts)
	{
	  if (count > 1)
	    penalty += increment * static_cast<double>(count - 1);
	}

      return penalty;
    }

    double combinedProbability(const std::vector<ResolvedOpportunity>& legs, double penalty)
    {
      double product = 1.0;
      for (const auto& leg : legs)
	product *= leg.getProbability();

      return product * (1.0 - penalty);
    }

    double expectedValuePercent(double decimalOdds, double probability)
    {
      return (decimalOdds * probability - 1.0) * 100.0;
    }

    bool hasDuplicateLabel(const std::vector<ResolvedOpportunity>& legs)
    {
      std::set<std::string> labels;
      for (const auto& leg : legs)
	{
	  if (!labels.insert(leg.getLabel()).second)
	    return true;
	}

      return false;
    }

    std::string groupingCategoryTag(const std::vector<ResolvedOpportunity>& legs)
    {
      if (legs.empty())
	return kMixedCategoryTag;

      const std::string& first = legs.front().getCategoryTag();
      for (const auto& leg : legs)
	{
	  if (leg.getCategoryTag() != first)
	    return kMixedCategoryTag;
	}

      return first;
    }

    ScoredGrouping scoreGrouping(std::vector<ResolvedOpportunity> legs, double correlationIncrement)
    {
      if (legs.empty())
	throw std::invalid_argument("scoreGrouping: a grouping needs at least one leg");

      const double decimalOdds = combinedDecimalOdds(legs);
      const double penalty = correlationPenalty(legs, correlationIncrement);
      const double probability = combinedProbability(legs, penalty);
      const double ev = expectedValuePercent(decimalOdds, probability);
      std::string tag = groupingCategoryTag(legs);

      return ScoredGrouping(std::move(legs),
			    decimalOdds,
			    penalty,
			    probability,
			    ev,
			    std::move(tag),
			    odds::decimalToAmerican(decimalOdds));
    }
  }
}
