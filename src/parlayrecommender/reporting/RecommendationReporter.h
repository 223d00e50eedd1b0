#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "Recommendation.h"
#include "ValueBetAnalyzer.h"

namespace parlayrecommender
{
namespace reporting
{

/**
 * @brief Writes a RecommendationSet as a plain text report
 *
 * One section per category, each recommendation with its legs, American
 * odds, combined probability and expected value.
 */
class RecommendationReporter
{
public:
    static void writeReport(std::ostream& os, const parlayrec::RecommendationSet& results);

    static void writeCategory(std::ostream& os,
                              parlayrec::RecommendationCategory category,
                              const parlayrec::RecommendationSet& results);

    /// e.g. "2-leg parlay +300 | 76.95% | EV +207.80% | Chiefs, Bills"
    static std::string formatRecommendation(const parlayrec::Recommendation& recommendation);

    /// Value bets in rank order, then the suggested parlay when there is one
    static void writeValueBets(std::ostream& os,
                               const std::vector<parlayrec::ValueBetAnalysis>& valueBets,
                               const std::optional<parlayrec::ValueParlaySuggestion>& parlay);

    /// e.g. "Chiefs (NFL) @ 1.25 | fair -900 | edge +10.00% | EV +12.50% | confidence 0.990"
    static std::string formatValueBet(const parlayrec::ValueBetAnalysis& bet);

private:
    static std::string formatLeg(const parlayrec::ResolvedOpportunity& leg);
    static std::string sectionTitle(parlayrec::RecommendationCategory category);
    static void writeSectionHeader(std::ostream& os, const std::string& title);
    static void writeSectionFooter(std::ostream& os);
};

} // namespace reporting
} // namespace parlayrecommender
