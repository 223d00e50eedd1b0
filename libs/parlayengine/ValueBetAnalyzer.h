// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __VALUE_BET_ANALYZER_H
#define __VALUE_BET_ANALYZER_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "Opportunity.h"

namespace parlayrec
{
  /**
   * @class ValueBetAnalysis
   * @brief Price versus estimated true probability for one opportunity.
   *
   * Edge and EV are percentages. Confidence is p * (1 + edge) with the edge
   * as a fraction, so a higher value means a likelier and better priced bet.
   */
  class ValueBetAnalysis
  {
  public:
    ValueBetAnalysis(const Opportunity& opportunity,
		     double decimalOdds,
		     double trueProbability,
		     double edgePercent,
		     double expectedValuePercent,
		     double fairDecimalOdds,
		     std::optional<std::string> fairAmericanOdds,
		     double confidence,
		     bool valueBet)
      : mOpportunity(opportunity),
	mDecimalOdds(decimalOdds),
	mTrueProbability(trueProbability),
	mEdgePercent(edgePercent),
	mExpectedValuePercent(expectedValuePercent),
	mFairDecimalOdds(fairDecimalOdds),
	mFairAmericanOdds(std::move(fairAmericanOdds)),
	mConfidence(confidence),
	mValueBet(valueBet)
    {}

    const Opportunity& getOpportunity() const { return mOpportunity; }
    double getDecimalOdds() const { return mDecimalOdds; }
    double getTrueProbability() const { return mTrueProbability; }
    double getEdgePercent() const { return mEdgePercent; }
    double getExpectedValuePercent() const { return mExpectedValuePercent; }
    double getFairDecimalOdds() const { return mFairDecimalOdds; }

    /// std::nullopt for a certain outcome, which has no American line
    const std::optional<std::string>& getFairAmericanOdds() const { return mFairAmericanOdds; }

    double getConfidence() const { return mConfidence; }
    bool isValueBet() const { return mValueBet; }

  private:
    Opportunity mOpportunity;
    double mDecimalOdds;
    double mTrueProbability;
    double mEdgePercent;
    double mExpectedValuePercent;
    double mFairDecimalOdds;
    std::optional<std::string> mFairAmericanOdds;
    double mConfidence;
    bool mValueBet;
  };

  /**
   * @class ValueParlaySuggestion
   * @brief A parlay assembled from value bets in different categories.
   *
   * No correlation haircut is applied; the legs never share a category tag.
   */
  class ValueParlaySuggestion
  {
  public:
    ValueParlaySuggestion(std::vector<ValueBetAnalysis> legs,
			  double combinedProbability,
			  double fairDecimalOdds,
			  std::optional<std::string> fairAmericanOdds,
			  double bookmakerDecimalOdds,
			  std::string bookmakerAmericanOdds,
			  double expectedValuePercent)
      : mLegs(std::move(legs)),
	mCombinedProbability(combinedProbability),
	mFairDecimalOdds(fairDecimalOdds),
	mFairAmericanOdds(std::move(fairAmericanOdds)),
	mBookmakerDecimalOdds(bookmakerDecimalOdds),
	mBookmakerAmericanOdds(std::move(bookmakerAmericanOdds)),
	mExpectedValuePercent(expectedValuePercent)
    {}

    const std::vector<ValueBetAnalysis>& getLegs() const { return mLegs; }
    double getCombinedProbability() const { return mCombinedProbability; }
    double getFairDecimalOdds() const { return mFairDecimalOdds; }
    const std::optional<std::string>& getFairAmericanOdds() const { return mFairAmericanOdds; }
    double getBookmakerDecimalOdds() const { return mBookmakerDecimalOdds; }
    const std::string& getBookmakerAmericanOdds() const { return mBookmakerAmericanOdds; }
    double getExpectedValuePercent() const { return mExpectedValuePercent; }

    bool isValueParlay() const
    {
      return mExpectedValuePercent > 0.0;
    }

  private:
    std::vector<ValueBetAnalysis> mLegs;
    double mCombinedProbability;
    double mFairDecimalOdds;
    std::optional<std::string> mFairAmericanOdds;
    double mBookmakerDecimalOdds;
    std::string mBookmakerAmericanOdds;
    double mExpectedValuePercent;
  };

  /**
   * @class ValueBetAnalyzer
   * @brief Finds opportunities whose estimated true probability beats the price.
   *
   * The true probability of a record is its supplied win probability. A
   * value bet needs edge >= min edge and p >= the confidence threshold. Both
   * parameters are fractions clamped to [0, 1].
   */
  class ValueBetAnalyzer
  {
  public:
    static constexpr double kDefaultConfidenceThreshold = 0.6;
    static constexpr double kDefaultMinEdge = 0.05;
    static constexpr std::size_t kDefaultMaxValueBets = 5;
    static constexpr std::size_t kDefaultMaxParlayLegs = 3;

    /// Fair decimal odds reported for a zero probability
    static constexpr double kZeroProbabilityFairOdds = 100.0;

    explicit ValueBetAnalyzer(double confidenceThreshold = kDefaultConfidenceThreshold,
			      double minEdge = kDefaultMinEdge);

    void setConfidenceThreshold(double confidenceThreshold);
    void setMinEdge(double minEdge);

    double getConfidenceThreshold() const
    {
      return mConfidenceThreshold;
    }

    double getMinEdge() const
    {
      return mMinEdge;
    }

    /**
     * @brief Analyze one opportunity against an estimated true probability.
     * @throws InvalidOpportunityException if the odds are missing or <= 1.0, or
     *         trueProbability is outside [0, 1]
     */
    ValueBetAnalysis analyzeOdds(const Opportunity& opportunity, double trueProbability) const;

    /**
     * @brief Value bets ranked by descending confidence, at most maxBets.
     *
     * Records without a supplied probability, or whose odds or probability
     * cannot be analyzed, are skipped. Ties keep caller order.
     */
    std::vector<ValueBetAnalysis> findBestValueBets(const std::vector<Opportunity>& opportunities,
						    std::size_t maxBets = kDefaultMaxValueBets) const;

    /**
     * @brief Build a parlay from the highest-EV value bets.
     *
     * The best bet is always taken; later bets join while there is room and
     * their category tag differs from every leg already chosen.
     *
     * @return std::nullopt when fewer than two legs can be chosen
     */
    std::optional<ValueParlaySuggestion> suggestParlay(const std::vector<ValueBetAnalysis>& valueBets,
						       std::size_t maxLegs = kDefaultMaxParlayLegs) const;

    /**
     * @brief Blend a model probability with an observed win rate.
     *
     * The history weight grows with the sample, matches / 20, up to 0.7.
     * With no matches the model probability is returned unchanged. The
     * result is clamped to [0, 1].
     */
    static double blendWithHistory(std::size_t wins, std::size_t matches, double modelProbability);

  private:
    double mConfidenceThreshold;
    double mMinEdge;
  };
}

#endif
