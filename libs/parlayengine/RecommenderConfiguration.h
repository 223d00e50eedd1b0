// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RECOMMENDER_CONFIGURATION_H
#define __RECOMMENDER_CONFIGURATION_H 1

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "RecommendationCategory.h"

namespace parlayrec
{
  // Probability model used when a record carries no probability of its own.
  constexpr double kProbabilityBoostFactor = 2.5;
  constexpr double kProbabilityCeiling     = 0.9;

  // Search budget. Exhaustive enumeration is only done for pairs.
  constexpr std::size_t kTwoLegCandidateWindow    = 20;
  constexpr std::size_t kThreeLegCandidateWindow  = 15;
  constexpr std::size_t kFavoriteCandidateWindow  = 15;
  constexpr std::size_t kMaxRandomDrawAttempts    = 10;
  constexpr std::size_t kMaxResultsPerCategory    = 5;
  constexpr std::size_t kDefaultFavoriteLegCount  = 6;
  constexpr std::size_t kDefaultSourceLimit       = 30;

  constexpr double kTwoLegCorrelationIncrement   = 0.05;
  constexpr double kThreeLegCorrelationIncrement = 0.02;
  constexpr double kFavoriteCorrelationIncrement = 0.03;

  /**
   * @brief Acceptance thresholds and search budget for one recommendation category.
   *
   * candidateWindow == 0 means the whole resolved pool is considered
   * (single bets). maxAttempts only applies to the sampled categories.
   */
  struct CategoryThresholds
  {
    double minDecimalOdds = 1.0;
    // Percent, 0-100
    double minWinProbabilityPercent = 0.0;
    std::size_t maxResults = kMaxResultsPerCategory;
    std::size_t legCount = 1;
    std::size_t candidateWindow = 0;
    std::size_t maxAttempts = 0;
    double correlationIncrement = 0.0;
  };

  struct ProbabilityModel
  {
    double boostFactor = kProbabilityBoostFactor;
    double ceiling = kProbabilityCeiling;
  };

  /**
   * @class RecommenderConfiguration
   * @brief Thresholds, probability model and run options for the recommender.
   *
   * The defaults returned by createDefault() are the calibrated values. The
   * favorite-parlay thresholds (3.0 / 53%) are used instead of 6.0 / 70%,
   * which no grouping can meet under the probability model.
   *
   * JSON layout (every key optional, missing keys keep their defaults):
   * @code
   * {
   *   "probability_model": { "boost_factor": 2.5, "ceiling": 0.9 },
   *   "two_leg_parlays": { "min_odds": 4.0, "min_win_prob": 60.0, "max_results": 5,
   *                        "leg_count": 2, "candidate_window": 20,
   *                        "max_attempts": 0, "correlation_increment": 0.05 },
   *   "source_limit": 30,
   *   "verbose": false
   * }
   * @endcode
   */
  class RecommenderConfiguration
  {
  public:
    RecommenderConfiguration();

    static RecommenderConfiguration createDefault();

    /**
     * @brief Load a configuration file on top of the defaults.
     * @throws ConfigurationException if the file cannot be read or is malformed
     */
    static RecommenderConfiguration loadFromFile(const std::string& configPath);

    /**
     * @brief Parse JSON text on top of the defaults.
     * @throws ConfigurationException on a JSON syntax error or a value of the wrong type
     */
    static RecommenderConfiguration loadFromString(const std::string& jsonContent);

    void saveToFile(const std::string& configPath) const;
    std::string toJsonString() const;

    /**
     * @brief Check the configuration for values the engine cannot honor.
     *
     * Includes the correlation check: the worst case penalty for a category
     * is correlationIncrement * (legCount - 1) and must stay below 1, or the
     * combined probability could turn negative.
     *
     * @return One message per problem found; empty when the configuration is usable
     */
    std::vector<std::string> validate() const;

    const CategoryThresholds& getThresholds(RecommendationCategory category) const;
    void setThresholds(RecommendationCategory category, const CategoryThresholds& thresholds);

    const ProbabilityModel& getProbabilityModel() const
    {
      return mProbabilityModel;
    }

    void setProbabilityModel(const ProbabilityModel& model)
    {
      mProbabilityModel = model;
    }

    std::size_t getSourceLimit() const
    {
      return mSourceLimit;
    }

    void setSourceLimit(std::size_t limit)
    {
      mSourceLimit = limit;
    }

    bool isVerbose() const
    {
      return mVerbose;
    }

    void setVerbose(bool verbose)
    {
      mVerbose = verbose;
    }

  private:
    std::map<RecommendationCategory, CategoryThresholds> mThresholds;
    ProbabilityModel mProbabilityModel;
    std::size_t mSourceLimit;
    bool mVerbose;
  };
}

#endif
