// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "ProbabilityResolver.h"
#include "OddsConversion.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace parlayrec
{
  std::string resolutionFailureCode(ResolutionFailure failure)
  {
    switch (failure)
      {
      case ResolutionFailure::OddsMissing:         return "ODDS_MISSING";
      case ResolutionFailure::OddsNotFinite:       return "ODDS_NOT_FINITE";
      case ResolutionFailure::OddsNotAboveOne:     return "ODDS_NOT_ABOVE_ONE";
      case ResolutionFailure::ProbabilityAboveOne: return "PROBABILITY_ABOVE_ONE";
      }
    return "UNKNOWN";
  }

  double ProbabilityResolver::estimateProbability(double decimalOdds) const
  {
    return std::min(mModel.ceiling, mModel.boostFactor * odds::impliedProbability(decimalOdds));
  }

  ResolutionResult ProbabilityResolver::resolve(const std::vector<Opportunity>& opportunities) const
  {
    ResolutionResult result;
    result.resolved.reserve(opportunities.size());

    for (const auto& opportunity : opportunities)
      {
	const auto& decimalOdds = opportunity.getDecimalOdds();

	if (!decimalOdds)
	  {
	    result.rejected.push_back({opportunity.getId(), ResolutionFailure::OddsMissing,
				       "no odds supplied"});
	    continue;
	  }

	const double oddsValue = *decimalOdds;
	if (!std::isfinite(oddsValue))
	  {
	    result.rejected.push_back({opportunity.getId(), ResolutionFailure::OddsNotFinite,
				       "odds are not a finite number"});
	    continue;
	  }

	if (oddsValue <= 1.0)
	  {
	    std::ostringstream msg;
	    msg << "decimal odds " << oddsValue << " do not exceed 1.0";
	    result.rejected.push_back({opportunity.getId(), ResolutionFailure::OddsNotAboveOne,
				       msg.str()});
	    continue;
	  }

	const auto& supplied = opportunity.getWinProbability();
	if (supplied && *supplied > 1.0)
	  {
	    std::ostringstream msg;
	    msg << "supplied probability " << *supplied << " exceeds 1.0";
	    result.rejected.push_back({opportunity.getId(), ResolutionFailure::ProbabilityAboveOne,
				       msg.str()});
	    continue;
	  }

	if (supplied && *supplied > 0.0)
	  result.resolved.emplace_back(opportunity, oddsValue, *supplied, false);
	else
	  result.resolved.emplace_back(opportunity, oddsValue, estimateProbability(oddsValue), true);
      }

    return result;
  }
}
