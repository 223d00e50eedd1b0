// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __GENERATION_SUMMARY_H
#define __GENERATION_SUMMARY_H 1

#include <cstddef>
#include "GroupingReject.h"

namespace parlayrec
{
  /**
   * @class GenerationSummary
   * @brief Counters describing one generator run for one category.
   *
   * A grouping that fails both thresholds is counted under both rejection
   * counters, so the counters need not add up to getCandidatesEvaluated().
   */
  class GenerationSummary
  {
  public:
    GenerationSummary()
      : mRecordsSupplied(0),
	mRecordsResolved(0),
	mCandidatesEvaluated(0),
	mRandomDraws(0),
	mBelowMinOddsCount(0),
	mBelowMinProbabilityCount(0),
	mDuplicateLabelCount(0),
	mDuplicateLabelSetCount(0),
	mAcceptedCount(0),
	mWindowSize(0),
	mInsufficientPool(false)
    {}

    std::size_t getRecordsSupplied() const { return mRecordsSupplied; }
    std::size_t getRecordsResolved() const { return mRecordsResolved; }
    std::size_t getCandidatesEvaluated() const { return mCandidatesEvaluated; }
    std::size_t getRandomDraws() const { return mRandomDraws; }
    std::size_t getBelowMinOddsCount() const { return mBelowMinOddsCount; }
    std::size_t getBelowMinProbabilityCount() const { return mBelowMinProbabilityCount; }
    std::size_t getDuplicateLabelCount() const { return mDuplicateLabelCount; }
    std::size_t getDuplicateLabelSetCount() const { return mDuplicateLabelSetCount; }

    /// Groupings that met both thresholds, before ranking and truncation
    std::size_t getAcceptedCount() const { return mAcceptedCount; }

    /// Number of resolved records the generator drew its groupings from
    std::size_t getWindowSize() const { return mWindowSize; }

    /// true when the window held fewer records than the leg count
    bool isInsufficientPool() const { return mInsufficientPool; }

    void setRecordsSupplied(std::size_t n) { mRecordsSupplied = n; }
    void setRecordsResolved(std::size_t n) { mRecordsResolved = n; }
    void incrementCandidatesEvaluated() { ++mCandidatesEvaluated; }
    void incrementRandomDraws() { ++mRandomDraws; }
    void incrementAcceptedCount() { ++mAcceptedCount; }
    void setWindowSize(std::size_t n) { mWindowSize = n; }
    void setInsufficientPool(bool insufficient) { mInsufficientPool = insufficient; }

    void recordRejection(GroupingReject mask)
    {
      if (hasRejection(mask, GroupingReject::BelowMinOdds))
	++mBelowMinOddsCount;
      if (hasRejection(mask, GroupingReject::BelowMinProbability))
	++mBelowMinProbabilityCount;
      if (hasRejection(mask, GroupingReject::DuplicateLabel))
	++mDuplicateLabelCount;
      if (hasRejection(mask, GroupingReject::DuplicateLabelSet))
	++mDuplicateLabelSetCount;
    }

  private:
    std::size_t mRecordsSupplied;
    std::size_t mRecordsResolved;
    std::size_t mCandidatesEvaluated;
    std::size_t mRandomDraws;
    std::size_t mBelowMinOddsCount;
    std::size_t mBelowMinProbabilityCount;
    std::size_t mDuplicateLabelCount;
    std::size_t mDuplicateLabelSetCount;
    std::size_t mAcceptedCount;
    std::size_t mWindowSize;
    bool mInsufficientPool;
  };
}

#endif
