#include <catch2/catch.hpp>
#include <fstream>
#include <boost/filesystem.hpp>
#include "RecommenderConfiguration.h"
#include "ParlayException.h"

using namespace parlayrec;

TEST_CASE ("Default configuration", "[RecommenderConfiguration]")
{
  auto config = RecommenderConfiguration::createDefault();

  REQUIRE (config.validate().empty());
  REQUIRE (config.getSourceLimit() == 30);
  REQUIRE_FALSE (config.isVerbose());
  REQUIRE (config.getProbabilityModel().boostFactor == Approx(2.5));
  REQUIRE (config.getProbabilityModel().ceiling == Approx(0.9));

  const auto& singles = config.getThresholds(RecommendationCategory::SingleBets);
  REQUIRE (singles.minDecimalOdds == Approx(2.0));
  REQUIRE (singles.minWinProbabilityPercent == Approx(80.0));
  REQUIRE (singles.candidateWindow == 0);

  const auto& pairs = config.getThresholds(RecommendationCategory::TwoLegParlays);
  REQUIRE (pairs.minDecimalOdds == Approx(4.0));
  REQUIRE (pairs.minWinProbabilityPercent == Approx(60.0));
  REQUIRE (pairs.candidateWindow == 20);
  REQUIRE (pairs.correlationIncrement == Approx(0.05));

  const auto& triples = config.getThresholds(RecommendationCategory::ThreeLegParlays);
  REQUIRE (triples.minDecimalOdds == Approx(5.0));
  REQUIRE (triples.candidateWindow == 15);
  REQUIRE (triples.maxAttempts == 10);
  REQUIRE (triples.correlationIncrement == Approx(0.02));

  const auto& favorites = config.getThresholds(RecommendationCategory::FavoriteParlays);
  REQUIRE (favorites.legCount == 6);
  REQUIRE (favorites.minDecimalOdds == Approx(3.0));
  REQUIRE (favorites.minWinProbabilityPercent == Approx(53.0));
  REQUIRE (favorites.candidateWindow == 15);
  REQUIRE (favorites.maxAttempts == 10);
  REQUIRE (favorites.correlationIncrement == Approx(0.03));
  REQUIRE (favorites.maxResults == 5);
}

TEST_CASE ("Loading JSON overrides only the keys present", "[RecommenderConfiguration]")
{
  const std::string json = R"({
    "probability_model": { "ceiling": 0.8 },
    "favorite_parlays": { "leg_count": 4, "min_win_prob": 55.5 },
    "source_limit": 50,
    "verbose": true,
    "unrelated": "ignored"
  })";

  auto config = RecommenderConfiguration::loadFromString(json);

  REQUIRE (config.getProbabilityModel().ceiling == Approx(0.8));
  REQUIRE (config.getProbabilityModel().boostFactor == Approx(2.5));
  REQUIRE (config.getThresholds(RecommendationCategory::FavoriteParlays).legCount == 4);
  REQUIRE (config.getThresholds(RecommendationCategory::FavoriteParlays).minWinProbabilityPercent == Approx(55.5));
  REQUIRE (config.getThresholds(RecommendationCategory::FavoriteParlays).minDecimalOdds == Approx(3.0));
  REQUIRE (config.getSourceLimit() == 50);
  REQUIRE (config.isVerbose());
  REQUIRE (config.validate().empty());
}

TEST_CASE ("Malformed configuration is reported", "[RecommenderConfiguration]")
{
  REQUIRE_THROWS_AS (RecommenderConfiguration::loadFromString("{ \"source_limit\": "), ConfigurationException);
  REQUIRE_THROWS_AS (RecommenderConfiguration::loadFromString("[1, 2]"), ConfigurationException);
  REQUIRE_THROWS_AS (RecommenderConfiguration::loadFromString(R"({"two_leg_parlays": {"min_odds": "high"}})"),
		     ConfigurationException);
  REQUIRE_THROWS_AS (RecommenderConfiguration::loadFromString(R"({"source_limit": -3})"),
		     ConfigurationException);
  REQUIRE_THROWS_AS (RecommenderConfiguration::loadFromString(R"({"verbose": 1})"),
		     ConfigurationException);
  REQUIRE_THROWS_AS (RecommenderConfiguration::loadFromFile("/nonexistent/parlay.json"),
		     ConfigurationException);
}

TEST_CASE ("validate reports unusable values", "[RecommenderConfiguration]")
{
  auto config = RecommenderConfiguration::createDefault();

  SECTION ("penalty that can reach one")
    {
      auto favorites = config.getThresholds(RecommendationCategory::FavoriteParlays);
      favorites.correlationIncrement = 0.25;   // 0.25 * 5 = 1.25
      config.setThresholds(RecommendationCategory::FavoriteParlays, favorites);

      auto errors = config.validate();
      REQUIRE (errors.size() == 1);
      REQUIRE (errors[0].find("favorite_parlays.correlation_increment") != std::string::npos);
    }

  SECTION ("window smaller than leg count")
    {
      auto favorites = config.getThresholds(RecommendationCategory::FavoriteParlays);
      favorites.legCount = 20;
      config.setThresholds(RecommendationCategory::FavoriteParlays, favorites);

      REQUIRE_FALSE (config.validate().empty());
    }

  SECTION ("probability model out of range")
    {
      ProbabilityModel model;
      model.ceiling = 1.5;
      model.boostFactor = 0.0;
      config.setProbabilityModel(model);

      REQUIRE (config.validate().size() == 2);
    }

  SECTION ("fixed leg counts")
    {
      auto triples = config.getThresholds(RecommendationCategory::ThreeLegParlays);
      triples.legCount = 4;
      config.setThresholds(RecommendationCategory::ThreeLegParlays, triples);

      REQUIRE (config.validate().size() == 1);
    }
}

TEST_CASE ("Configuration survives a save and reload", "[RecommenderConfiguration]")
{
  auto config = RecommenderConfiguration::createDefault();
  auto pairs = config.getThresholds(RecommendationCategory::TwoLegParlays);
  pairs.minDecimalOdds = 3.5;
  pairs.maxResults = 8;
  config.setThresholds(RecommendationCategory::TwoLegParlays, pairs);
  config.setSourceLimit(45);

  const auto path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("parlay-config-%%%%-%%%%.json");
  config.saveToFile(path.string());

  auto reloaded = RecommenderConfiguration::loadFromFile(path.string());
  boost::filesystem::remove(path);

  REQUIRE (reloaded.getThresholds(RecommendationCategory::TwoLegParlays).minDecimalOdds == Approx(3.5));
  REQUIRE (reloaded.getThresholds(RecommendationCategory::TwoLegParlays).maxResults == 8);
  REQUIRE (reloaded.getSourceLimit() == 45);
  REQUIRE (reloaded.toJsonString() == config.toJsonString());
}
