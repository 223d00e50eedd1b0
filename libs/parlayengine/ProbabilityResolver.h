// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PROBABILITY_RESOLVER_H
#define __PROBABILITY_RESOLVER_H 1

#include <string>
#include <vector>
#include "Opportunity.h"
#include "RecommenderConfiguration.h"

namespace parlayrec
{
  /**
   * @brief Why a record was left out of the resolved pool.
   */
  enum class ResolutionFailure
    {
      OddsMissing,
      OddsNotFinite,
      OddsNotAboveOne,
      ProbabilityAboveOne
    };

  std::string resolutionFailureCode(ResolutionFailure failure);

  struct RejectedOpportunity
  {
    std::string id;
    ResolutionFailure reason;
    std::string message;
  };

  struct ResolutionResult
  {
    std::vector<ResolvedOpportunity> resolved;
    std::vector<RejectedOpportunity> rejected;
  };

  /**
   * @class ProbabilityResolver
   * @brief Turns raw opportunities into a pool every generator can score.
   *
   * A supplied probability greater than zero is used unchanged. Otherwise the
   * probability is min(ceiling, boostFactor / decimalOdds). Records with
   * missing, non-finite or degenerate (<= 1.0) odds are dropped one at a
   * time; a bad record never fails the batch. Resolved records keep the
   * caller's order.
   */
  class ProbabilityResolver
  {
  public:
    explicit ProbabilityResolver(const ProbabilityModel& model = ProbabilityModel())
      : mModel(model)
    {}

    ResolutionResult resolve(const std::vector<Opportunity>& opportunities) const;

    /// min(ceiling, boostFactor * (1 / decimalOdds)); decimalOdds must be > 1
    double estimateProbability(double decimalOdds) const;

    const ProbabilityModel& getModel() const
    {
      return mModel;
    }

  private:
    ProbabilityModel mModel;
  };
}

#endif
