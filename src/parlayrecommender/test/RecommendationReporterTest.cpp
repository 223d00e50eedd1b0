#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <random>
#include <sstream>
#include "ParlayRecommender.h"
#include "reporting/RecommendationReporter.h"
#include "utils/OutputUtils.h"

using namespace parlayrec;
using parlayrecommender::reporting::RecommendationReporter;
using parlayrecommender::utils::TeeStream;

namespace
{
  RecommendationSet twoFavorites()
  {
    std::ostringstream log;
    ParlayRecommender<std::mt19937_64> recommender(RecommenderConfiguration::createDefault(),
						   std::mt19937_64(1u), log);
    return recommender.recommendAll({ Opportunity("1", "Chiefs", "NFL", 2.0),
				      Opportunity("2", "Bills", "NFL", 2.0) });
  }
}

TEST_CASE ("formatRecommendation", "[RecommendationReporter]")
{
  auto results = twoFavorites();
  const auto& pairs = results.getRecommendations(RecommendationCategory::TwoLegParlays);
  REQUIRE (pairs.size() == 1);

  REQUIRE (RecommendationReporter::formatRecommendation(pairs[0]) ==
	   "2-leg parlay +300 | 76.95% | EV +207.80% | Chiefs, Bills");
}

TEST_CASE ("writeReport covers every category", "[RecommendationReporter]")
{
  auto results = twoFavorites();
  std::ostringstream os;
  RecommendationReporter::writeReport(os, results);

  const std::string report = os.str();
  REQUIRE (report.find("=== Single Bets ===") != std::string::npos);
  REQUIRE (report.find("=== Two-Leg Parlays ===") != std::string::npos);
  REQUIRE (report.find("=== Three-Leg Parlays ===") != std::string::npos);
  REQUIRE (report.find("=== Favorite Parlays ===") != std::string::npos);
  REQUIRE (report.find("Not enough opportunities (2 available)") != std::string::npos);
  REQUIRE (report.find("Total recommendations: 3") != std::string::npos);
}

TEST_CASE ("writeReport leaves the stream formatting unchanged", "[RecommendationReporter]")
{
  auto results = twoFavorites();
  std::ostringstream os;
  const auto flags = os.flags();
  const auto precision = os.precision();

  RecommendationReporter::writeReport(os, results);

  REQUIRE (os.flags() == flags);
  REQUIRE (os.precision() == precision);

  os.str("");
  os << 0.5;
  REQUIRE (os.str() == "0.5");
}

TEST_CASE ("Value bet section", "[RecommendationReporter]")
{
  ValueBetAnalyzer analyzer;
  auto valueBets = analyzer.findBestValueBets({ Opportunity("a", "Celtics", "NBA", 1.8, 0.65),
						Opportunity("f", "Chiefs", "NFL", 1.25, 0.9) });
  REQUIRE (valueBets.size() == 2);

  REQUIRE (RecommendationReporter::formatValueBet(valueBets[0]) ==
	   "Chiefs (NFL) @ 1.25 | fair -900 | edge +10.00% | EV +12.50% | confidence 0.990");

  std::ostringstream os;
  RecommendationReporter::writeValueBets(os, valueBets, analyzer.suggestParlay(valueBets));
  const std::string section = os.str();
  REQUIRE (section.find("=== Value Bets ===") != std::string::npos);
  REQUIRE (section.find("Suggested parlay") != std::string::npos);
  REQUIRE (section.find("Celtics, Chiefs") != std::string::npos);

  std::ostringstream empty;
  RecommendationReporter::writeValueBets(empty, {}, std::nullopt);
  REQUIRE (empty.str().find("No value bets") != std::string::npos);
}

TEST_CASE ("TeeStream mirrors output", "[OutputUtils]")
{
  std::ostringstream a;
  std::ostringstream b;
  TeeStream tee(a, b);

  tee << "parlay " << 3 << std::endl;

  REQUIRE (a.str() == "parlay 3\n");
  REQUIRE (b.str() == "parlay 3\n");
}
