// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "ValueBetAnalyzer.h"
#include <algorithm>
#include <cmath>
#include "OddsConversion.h"
#include "ParlayException.h"
#include "ParlayScoring.h"

namespace parlayrec
{
  namespace
  {
    double clampUnit(double value)
    {
      return std::max(0.0, std::min(1.0, value));
    }

    bool validOdds(const std::optional<double>& decimalOdds)
    {
      return decimalOdds.has_value() && std::isfinite(*decimalOdds) && *decimalOdds > 1.0;
    }

    bool validProbability(double probability)
    {
      return std::isfinite(probability) && probability >= 0.0 && probability <= 1.0;
    }

    double fairDecimalOdds(double probability)
    {
      return probability > 0.0 ? 1.0 / probability : ValueBetAnalyzer::kZeroProbabilityFairOdds;
    }

    std::optional<std::string> fairAmericanOdds(double fairDecimal)
    {
      if (fairDecimal <= 1.0)
	return std::nullopt;

      return odds::decimalToAmerican(fairDecimal);
    }
  }

  ValueBetAnalyzer::ValueBetAnalyzer(double confidenceThreshold, double minEdge)
    : mConfidenceThreshold(clampUnit(confidenceThreshold)),
      mMinEdge(clampUnit(minEdge))
  {}

  void ValueBetAnalyzer::setConfidenceThreshold(double confidenceThreshold)
  {
    mConfidenceThreshold = clampUnit(confidenceThreshold);
  }

  void ValueBetAnalyzer::setMinEdge(double minEdge)
  {
    mMinEdge = clampUnit(minEdge);
  }

  ValueBetAnalysis ValueBetAnalyzer::analyzeOdds(const Opportunity& opportunity,
						 double trueProbability) const
  {
    if (!validOdds(opportunity.getDecimalOdds()))
      throw InvalidOpportunityException("analyzeOdds: opportunity " + opportunity.getId()
					+ " has no decimal odds above 1.0");

    if (!validProbability(trueProbability))
      throw InvalidOpportunityException("analyzeOdds: true probability must lie in [0, 1], got "
					+ std::to_string(trueProbability));

    const double decimalOdds = *opportunity.getDecimalOdds();
    const double edge = trueProbability - odds::impliedProbability(decimalOdds);
    const double fairDecimal = fairDecimalOdds(trueProbability);
    const bool valueBet = (edge >= mMinEdge) && (trueProbability >= mConfidenceThreshold);

    return ValueBetAnalysis(opportunity,
			    decimalOdds,
			    trueProbability,
			    edge * 100.0,
			    scoring::expectedValuePercent(decimalOdds, trueProbability),
			    fairDecimal,
			    fairAmericanOdds(fairDecimal),
			    trueProbability * (1.0 + edge),
			    valueBet);
  }

  std::vector<ValueBetAnalysis>
  ValueBetAnalyzer::findBestValueBets(const std::vector<Opportunity>& opportunities,
				      std::size_t maxBets) const
  {
    std::vector<ValueBetAnalysis> valueBets;

    for (const auto& opportunity : opportunities)
      {
	const auto& probability = opportunity.getWinProbability();
	if (!probability || !validProbability(*probability) || !validOdds(opportunity.getDecimalOdds()))
	  continue;

	ValueBetAnalysis analysis = analyzeOdds(opportunity, *probability);
	if (analysis.isValueBet())
	  valueBets.push_back(std::move(analysis));
      }

    std::stable_sort(valueBets.begin(), valueBets.end(),
		     [](const ValueBetAnalysis& lhs, const ValueBetAnalysis& rhs) {
		       return lhs.getConfidence() > rhs.getConfidence();
		     });

    if (valueBets.size() > maxBets)
      valueBets.erase(valueBets.begin() + maxBets, valueBets.end());

    return valueBets;
  }

  std::optional<ValueParlaySuggestion>
  ValueBetAnalyzer::suggestParlay(const std::vector<ValueBetAnalysis>& valueBets,
				  std::size_t maxLegs) const
  {
    if (valueBets.size() < 2 || maxLegs < 2)
      return std::nullopt;

    std::vector<ValueBetAnalysis> byValue(valueBets);
    std::stable_sort(byValue.begin(), byValue.end(),
		     [](const ValueBetAnalysis& lhs, const ValueBetAnalysis& rhs) {
		       return lhs.getExpectedValuePercent() > rhs.getExpectedValuePercent();
		     });

    std::vector<ValueBetAnalysis> legs;
    legs.push_back(byValue.front());

    for (auto it = byValue.begin() + 1; it != byValue.end() && legs.size() < maxLegs; ++it)
      {
	const std::string& tag = it->getOpportunity().getCategoryTag();
	bool differentCategory = std::none_of(legs.begin(), legs.end(),
					      [&tag](const ValueBetAnalysis& leg) {
						return leg.getOpportunity().getCategoryTag() == tag;
					      });
	if (differentCategory)
	  legs.push_back(*it);
      }

    if (legs.size() < 2)
      return std::nullopt;

    double combinedProbability = 1.0;
    double bookmakerOdds = 1.0;
    for (const auto& leg : legs)
      {
	combinedProbability *= leg.getTrueProbability();
	bookmakerOdds *= leg.getDecimalOdds();
      }

    const double fairDecimal = fairDecimalOdds(combinedProbability);

    return ValueParlaySuggestion(std::move(legs),
				 combinedProbability,
				 fairDecimal,
				 fairAmericanOdds(fairDecimal),
				 bookmakerOdds,
				 odds::decimalToAmerican(bookmakerOdds),
				 scoring::expectedValuePercent(bookmakerOdds, combinedProbability));
  }

  double ValueBetAnalyzer::blendWithHistory(std::size_t wins, std::size_t matches, double modelProbability)
  {
    if (matches == 0)
      return modelProbability;

    const double historicalRate = static_cast<double>(wins) / static_cast<double>(matches);
    const double weight = std::min(static_cast<double>(matches) / 20.0, 0.7);

    return clampUnit(weight * historicalRate + (1.0 - weight) * modelProbability);
  }
}
