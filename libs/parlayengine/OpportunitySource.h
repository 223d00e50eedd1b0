// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __OPPORTUNITY_SOURCE_H
#define __OPPORTUNITY_SOURCE_H 1

#include <cstddef>
#include <vector>
#include "Opportunity.h"

namespace parlayrec
{
  /**
   * @class OpportunitySource
   * @brief Read accessor for the open opportunities a caller wants recommendations for.
   *
   * Implementations may throw; ParlayRecommender::recommendFromSource turns a
   * failing source into an empty result.
   */
  class OpportunitySource
  {
  public:
    virtual ~OpportunitySource() = default;

    /// At most limit records, in the source's own order
    virtual std::vector<Opportunity> getOpenOpportunities(std::size_t limit) = 0;
  };
}

#endif
