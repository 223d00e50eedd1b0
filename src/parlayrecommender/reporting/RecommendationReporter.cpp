#include "RecommendationReporter.h"
#include <iomanip>
#include <sstream>

using namespace parlayrec;

namespace parlayrecommender
{
namespace reporting
{

void RecommendationReporter::writeReport(std::ostream& os, const RecommendationSet& results)
{
    for (auto category : kAllCategories)
    {
        writeCategory(os, category, results);
        os << std::endl;
    }

    os << "Total recommendations: " << results.getTotalRecommendations() << std::endl;
}

void RecommendationReporter::writeCategory(std::ostream& os,
                                           RecommendationCategory category,
                                           const RecommendationSet& results)
{
    const auto& recommendations = results.getRecommendations(category);
    const auto& summary = results.getSummary(category);

    writeSectionHeader(os, sectionTitle(category));

    if (recommendations.empty())
    {
        if (summary.isInsufficientPool())
            os << "Not enough opportunities (" << summary.getWindowSize() << " available)" << std::endl;
        else
            os << "No qualifying recommendations" << std::endl;
    }

    for (const auto& recommendation : recommendations)
    {
        os << recommendation.getRank() << ". " << formatRecommendation(recommendation) << std::endl;

        for (const auto& leg : recommendation.getLegs())
            os << "     " << formatLeg(leg) << std::endl;
    }

    os << "Candidates evaluated: " << summary.getCandidatesEvaluated()
       << ", random draws: " << summary.getRandomDraws()
       << ", accepted: " << summary.getAcceptedCount() << std::endl;

    writeSectionFooter(os);
}

std::string RecommendationReporter::formatRecommendation(const Recommendation& recommendation)
{
    std::ostringstream oss;
    oss << recommendation.getTypeLabel() << " " << recommendation.getAmericanOdds()
        << " | " << std::fixed << std::setprecision(2) << recommendation.getWinProbabilityPercent() << "%"
        << " | EV " << std::showpos << recommendation.getExpectedValuePercent() << std::noshowpos << "%"
        << " | ";

    bool first = true;
    for (const auto& leg : recommendation.getLegs())
    {
        if (!first)
            oss << ", ";
        oss << leg.getLabel();
        first = false;
    }

    return oss.str();
}

std::string RecommendationReporter::formatLeg(const ResolvedOpportunity& leg)
{
    std::ostringstream oss;
    oss << leg.getLabel() << " (" << leg.getCategoryTag() << ") @ "
        << std::fixed << std::setprecision(2) << leg.getDecimalOdds()
        << ", p=" << std::setprecision(3) << leg.getProbability()
        << (leg.isProbabilityEstimated() ? " est." : "");
    return oss.str();
}

void RecommendationReporter::writeValueBets(std::ostream& os,
                                            const std::vector<ValueBetAnalysis>& valueBets,
                                            const std::optional<ValueParlaySuggestion>& parlay)
{
    writeSectionHeader(os, "Value Bets");

    if (valueBets.empty())
        os << "No value bets" << std::endl;

    std::size_t rank = 1;
    for (const auto& bet : valueBets)
        os << rank++ << ". " << formatValueBet(bet) << std::endl;

    if (parlay)
    {
        std::ostringstream oss;
        oss << "Suggested parlay " << parlay->getBookmakerAmericanOdds()
            << " (fair " << parlay->getFairAmericanOdds().value_or("n/a") << ")"
            << " | " << std::fixed << std::setprecision(2) << parlay->getCombinedProbability() * 100.0 << "%"
            << " | EV " << std::showpos << parlay->getExpectedValuePercent() << std::noshowpos << "% | ";

        bool first = true;
        for (const auto& leg : parlay->getLegs())
        {
            if (!first)
                oss << ", ";
            oss << leg.getOpportunity().getLabel();
            first = false;
        }
        os << oss.str() << std::endl;
    }

    writeSectionFooter(os);
}

std::string RecommendationReporter::formatValueBet(const ValueBetAnalysis& bet)
{
    std::ostringstream oss;
    oss << bet.getOpportunity().getLabel() << " (" << bet.getOpportunity().getCategoryTag() << ") @ "
        << std::fixed << std::setprecision(2) << bet.getDecimalOdds()
        << " | fair " << bet.getFairAmericanOdds().value_or("n/a")
        << " | edge " << std::showpos << bet.getEdgePercent()
        << "% | EV " << bet.getExpectedValuePercent() << std::noshowpos
        << "% | confidence " << std::setprecision(3) << bet.getConfidence();
    return oss.str();
}

std::string RecommendationReporter::sectionTitle(RecommendationCategory category)
{
    switch (category)
    {
    case RecommendationCategory::SingleBets:      return "Single Bets";
    case RecommendationCategory::TwoLegParlays:   return "Two-Leg Parlays";
    case RecommendationCategory::ThreeLegParlays: return "Three-Leg Parlays";
    case RecommendationCategory::FavoriteParlays: return "Favorite Parlays";
    }
    return categoryName(category);
}

void RecommendationReporter::writeSectionHeader(std::ostream& os, const std::string& title)
{
    os << "=== " << title << " ===" << std::endl;
}

void RecommendationReporter::writeSectionFooter(std::ostream& os)
{
    os << "===================================" << std::endl;
}

} // namespace reporting
} // namespace parlayrecommender
