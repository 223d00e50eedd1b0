#include <catch2/catch.hpp>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include "ParlayRecommender.h"
#include "ParlayException.h"
#include "TestUtils.h"

using namespace parlayrec;
using parlayrec::diagnostics::DiagnosticEventType;
using parlayrec::test::makeOpportunity;
using parlayrec::test::RecordingObserver;

namespace
{
  using TestRecommender = ParlayRecommender<std::mt19937_64>;

  class ThrowingSource : public OpportunitySource
  {
  public:
    std::vector<Opportunity> getOpenOpportunities(std::size_t) override
    {
      throw DataSourceException("connection refused");
    }
  };

  class FixedSource : public OpportunitySource
  {
  public:
    explicit FixedSource(std::vector<Opportunity> opportunities)
      : mOpportunities(std::move(opportunities)),
	mRequestedLimit(0)
    {}

    std::vector<Opportunity> getOpenOpportunities(std::size_t limit) override
    {
      mRequestedLimit = limit;
      std::vector<Opportunity> out;
      for (std::size_t i = 0; i < mOpportunities.size() && i < limit; ++i)
	out.push_back(mOpportunities[i]);
      return out;
    }

    std::size_t getRequestedLimit() const { return mRequestedLimit; }

  private:
    std::vector<Opportunity> mOpportunities;
    std::size_t mRequestedLimit;
  };

  class NonStandardThrowingSource : public OpportunitySource
  {
  public:
    std::vector<Opportunity> getOpenOpportunities(std::size_t) override
    {
      throw 42;
    }
  };

  // Fails on every rejected record and on a data source failure
  class FailingOnFailuresObserver : public diagnostics::IRecommendationObserver
  {
  public:
    void onDiagnosticEvent(const diagnostics::RecommendationDiagnosticRecord& record) override
    {
      if (record.getEventType() == DiagnosticEventType::RecordRejected ||
	  record.getEventType() == DiagnosticEventType::DataSourceFailure)
	throw std::runtime_error("observer failure");
    }
  };

  // Fails while the two-leg category is being reported
  class FailingTwoLegObserver : public diagnostics::IRecommendationObserver
  {
  public:
    void onDiagnosticEvent(const diagnostics::RecommendationDiagnosticRecord& record) override
    {
      if (record.getEventType() == DiagnosticEventType::CategoryCompleted &&
	  record.getCategory() == RecommendationCategory::TwoLegParlays)
	throw std::runtime_error("observer failure");
    }
  };

  std::vector<Opportunity> randomPool(std::size_t size, std::uint64_t seed)
  {
    static const char* tags[] = { "NFL", "NBA", "MLB" };
    std::mt19937_64 gen(seed);
    std::uniform_real_distribution<double> oddsDist(1.1, 4.0);

    std::vector<Opportunity> pool;
    for (std::size_t i = 0; i < size; ++i)
      pool.push_back(makeOpportunity("op" + std::to_string(i),
				     "Team" + std::to_string(i % 22),
				     tags[i % 3],
				     oddsDist(gen)));
    return pool;
  }

  void requireLabelsUnique(const Recommendation& rec)
  {
    std::set<std::string> labels;
    for (const auto& leg : rec.getLegs())
      labels.insert(leg.getLabel());
    REQUIRE (labels.size() == rec.getLegs().size());
  }
}

TEST_CASE ("Two even-money favorites from one sport", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(11u), log);

  std::vector<Opportunity> input = {
    makeOpportunity("1", "Chiefs", "NFL", 2.0),
    makeOpportunity("2", "Bills", "NFL", 2.0)
  };

  auto results = recommender.recommendAll(input);

  const auto& pairs = results.getRecommendations(RecommendationCategory::TwoLegParlays);
  REQUIRE (pairs.size() == 1);
  REQUIRE (pairs[0].getCombinedDecimalOdds() == Approx(4.0));
  REQUIRE (pairs[0].getAmericanOdds() == "+300");
  REQUIRE (pairs[0].getWinProbabilityPercent() == Approx(76.95));
  REQUIRE (pairs[0].getExpectedValuePercent() == Approx(207.8));
  REQUIRE (pairs[0].getCorrelationPenalty() == Approx(0.05));
  REQUIRE (pairs[0].getCategoryTag() == "NFL");
  REQUIRE (pairs[0].getTypeLabel() == "2-leg parlay");

  REQUIRE (results.getRecommendations(RecommendationCategory::SingleBets).size() == 2);
  REQUIRE (results.getRecommendations(RecommendationCategory::ThreeLegParlays).empty());
  REQUIRE (results.getRecommendations(RecommendationCategory::FavoriteParlays).empty());
}

TEST_CASE ("A single opportunity only yields a single bet", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(3u), log);
  RecordingObserver observer;
  recommender.attach(&observer);

  auto results = recommender.recommendAll({ makeOpportunity("1", "Celtics", "NBA", 2.5) });

  const auto& singles = results.getRecommendations(RecommendationCategory::SingleBets);
  REQUIRE (singles.size() == 1);
  REQUIRE (singles[0].getExpectedValuePercent() == Approx(125.0));

  REQUIRE (results.getRecommendations(RecommendationCategory::TwoLegParlays).empty());
  REQUIRE (results.getRecommendations(RecommendationCategory::ThreeLegParlays).empty());
  REQUIRE (results.getRecommendations(RecommendationCategory::FavoriteParlays).empty());
  REQUIRE (results.getSummary(RecommendationCategory::ThreeLegParlays).getRandomDraws() == 0);
  REQUIRE (results.getSummary(RecommendationCategory::FavoriteParlays).getRandomDraws() == 0);

  REQUIRE (observer.countOf(DiagnosticEventType::InsufficientPool) == 3);
  REQUIRE (observer.countOf(DiagnosticEventType::CategoryCompleted) == 1);
}

TEST_CASE ("A failing data source degrades to empty results", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(5u), log);
  RecordingObserver observer;
  recommender.attach(&observer);

  ThrowingSource source;
  RecommendationSet results;
  REQUIRE_NOTHROW (results = recommender.recommendFromSource(source));

  REQUIRE (results.isEmpty());
  for (auto category : kAllCategories)
    REQUIRE (results.getRecommendations(category).empty());

  REQUIRE (results.toNamedMap().size() == 4);
  REQUIRE (observer.countOf(DiagnosticEventType::DataSourceFailure) == 1);
  REQUIRE (log.str().find("connection refused") != std::string::npos);
}

TEST_CASE ("recommendFromSource reads up to the limit", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(5u), log);
  FixedSource source(randomPool(40, 77u));

  SECTION ("configured default")
    {
      auto results = recommender.recommendFromSource(source);
      REQUIRE (source.getRequestedLimit() == kDefaultSourceLimit);
      REQUIRE (results.getSummary(RecommendationCategory::SingleBets).getRecordsSupplied() == 30);
    }

  SECTION ("explicit limit")
    {
      auto results = recommender.recommendFromSource(source, 12);
      REQUIRE (source.getRequestedLimit() == 12);
      REQUIRE (results.getSummary(RecommendationCategory::TwoLegParlays).getRecordsSupplied() == 12);
    }
}

TEST_CASE ("Favorite parlays with six legs from five records", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(8u), log);

  auto result = recommender.getFavoriteParlays(test::makeFavoritesPool(5, 1.25));

  REQUIRE (result.recommendations.empty());
  REQUIRE (result.summary.getRandomDraws() == 0);
}

TEST_CASE ("Favorite parlays with caller supplied leg count", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(8u), log);

  // 1.5^4 = 5.06, 0.9^4 = 65.61%
  auto result = recommender.getFavoriteParlays(test::makeFavoritesPool(4, 1.5), 4, 2.0, 60.0);

  REQUIRE (result.recommendations.size() == 1);
  REQUIRE (result.recommendations[0].getTypeLabel() == "4-leg favorite parlay");
  REQUIRE (result.recommendations[0].getWinProbabilityPercent() == Approx(65.61));

  auto strict = recommender.getFavoriteParlays(test::makeFavoritesPool(4, 1.5), 4, 6.0, 60.0);
  REQUIRE (strict.recommendations.empty());
  REQUIRE (strict.summary.getBelowMinOddsCount() == 10);
}

TEST_CASE ("Rejected records are reported and excluded", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(9u), log);
  RecordingObserver observer;
  recommender.attach(&observer);

  std::vector<Opportunity> input = {
    makeOpportunity("good1", "Chiefs", "NFL", 2.0),
    makeOpportunity("even", "Bills", "NFL", 1.0),
    makeOpportunity("none", "Jets", "NFL", std::nullopt),
    makeOpportunity("good2", "Eagles", "NFL", 2.0)
  };

  auto results = recommender.recommendAll(input);

  REQUIRE (observer.countOf(DiagnosticEventType::RecordRejected) == 2);
  REQUIRE (results.getSummary(RecommendationCategory::SingleBets).getRecordsSupplied() == 4);
  REQUIRE (results.getSummary(RecommendationCategory::SingleBets).getRecordsResolved() == 2);

  for (auto category : kAllCategories)
    for (const auto& rec : results.getRecommendations(category))
      for (const auto& leg : rec.getLegs())
	{
	  REQUIRE (leg.getId() != "even");
	  REQUIRE (leg.getId() != "none");
	}

  recommender.detach(&observer);
  REQUIRE (recommender.getNumObservers() == 0);
}

TEST_CASE ("A failure in one category leaves the others intact", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(10u), log);
  FailingTwoLegObserver failing;
  RecordingObserver observer;
  recommender.attach(&failing);
  recommender.attach(&observer);

  std::vector<Opportunity> input = {
    makeOpportunity("1", "Chiefs", "NFL", 2.0),
    makeOpportunity("2", "Bills", "NFL", 2.0)
  };

  RecommendationSet results;
  REQUIRE_NOTHROW (results = recommender.recommendAll(input));

  REQUIRE (results.getRecommendations(RecommendationCategory::TwoLegParlays).empty());
  REQUIRE (results.getRecommendations(RecommendationCategory::SingleBets).size() == 2);
  REQUIRE (observer.countOf(DiagnosticEventType::CategoryFailure) == 1);
  REQUIRE (log.str().find("two_leg_parlays") != std::string::npos);
}

TEST_CASE ("An observer failing on rejected records does not stop generation", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(11u), log);
  FailingOnFailuresObserver failing;
  RecordingObserver observer;
  recommender.attach(&failing);
  recommender.attach(&observer);

  std::vector<Opportunity> input = {
    makeOpportunity("1", "Chiefs", "NFL", 2.0),
    makeOpportunity("2", "Bills", "NFL", 2.0),
    makeOpportunity("bad", "Jets", "NFL", 0.9)
  };

  RecommendationSet results;
  REQUIRE_NOTHROW (results = recommender.recommendAll(input));

  REQUIRE (results.getRecommendations(RecommendationCategory::SingleBets).size() == 2);
  REQUIRE (results.getRecommendations(RecommendationCategory::TwoLegParlays).size() == 1);
  REQUIRE (results.getSummary(RecommendationCategory::TwoLegParlays).getRecordsResolved() == 2);
  REQUIRE (observer.countOf(DiagnosticEventType::CategoryFailure) == 0);
  REQUIRE (log.str().find("Error reporting RECORD_REJECTED diagnostic") != std::string::npos);

  SECTION ("and on a data source failure")
    {
      ThrowingSource source;
      REQUIRE_NOTHROW (results = recommender.recommendFromSource(source));
      REQUIRE (results.isEmpty());
      REQUIRE (log.str().find("Error reporting DATA_SOURCE_FAILURE diagnostic") != std::string::npos);
    }
}

TEST_CASE ("A source throwing a non-standard exception degrades to empty results", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(12u), log);
  RecordingObserver observer;
  recommender.attach(&observer);

  NonStandardThrowingSource source;
  RecommendationSet results;
  REQUIRE_NOTHROW (results = recommender.recommendFromSource(source, 10));

  REQUIRE (results.isEmpty());
  REQUIRE (observer.countOf(DiagnosticEventType::DataSourceFailure) == 1);
  REQUIRE (observer.getRecords().back().getReason() == "UNKNOWN");
  REQUIRE (log.str().find("unknown exception") != std::string::npos);
}

TEST_CASE ("recommendForCategoryTag filters by sport", "[ParlayRecommender]")
{
  std::ostringstream log;
  TestRecommender recommender(RecommenderConfiguration::createDefault(), std::mt19937_64(12u), log);

  std::vector<Opportunity> input = {
    makeOpportunity("1", "Chiefs", "NFL", 2.0),
    makeOpportunity("2", "Lakers", "NBA", 2.2),
    makeOpportunity("3", "Bills", "NFL", 2.0),
    makeOpportunity("4", "Celtics", "NBA", 2.4)
  };

  auto nfl = recommender.recommendForCategoryTag(input, "NFL");
  for (auto category : kAllCategories)
    for (const auto& rec : nfl.getRecommendations(category))
      for (const auto& leg : rec.getLegs())
	REQUIRE (leg.getCategoryTag() == "NFL");
  REQUIRE (nfl.getSummary(RecommendationCategory::SingleBets).getRecordsSupplied() == 2);

  auto everything = recommender.recommendForCategoryTag(input, "");
  REQUIRE (everything.getSummary(RecommendationCategory::SingleBets).getRecordsSupplied() == 4);

  auto nothing = recommender.recommendForCategoryTag(input, "NHL");
  REQUIRE (nothing.isEmpty());
}

TEST_CASE ("Every recommendation satisfies the ranking and threshold rules", "[ParlayRecommender][property]")
{
  const auto config = RecommenderConfiguration::createDefault();

  for (std::uint64_t seed = 1; seed <= 25; ++seed)
    {
      std::ostringstream log;
      TestRecommender recommender(config, std::mt19937_64(seed), log);
      auto results = recommender.recommendAll(randomPool(30, seed * 31u));

      for (auto category : kAllCategories)
	{
	  const auto& thresholds = config.getThresholds(category);
	  const auto& recs = results.getRecommendations(category);
	  REQUIRE (recs.size() <= thresholds.maxResults);

	  std::set<std::set<std::string>> labelSets;

	  for (std::size_t i = 0; i < recs.size(); ++i)
	    {
	      const auto& rec = recs[i];
	      REQUIRE (rec.getRank() == i + 1);
	      REQUIRE (rec.getLegs().size() == thresholds.legCount);
	      requireLabelsUnique(rec);

	      double product = 1.0;
	      for (const auto& leg : rec.getLegs())
		{
		  REQUIRE (leg.getDecimalOdds() > 1.0);
		  REQUIRE (leg.getProbability() > 0.0);
		  REQUIRE (leg.getProbability() <= 0.9);
		  product *= leg.getDecimalOdds();
		}
	      REQUIRE (rec.getCombinedDecimalOdds() == product);

	      REQUIRE (rec.getCombinedDecimalOdds() >= thresholds.minDecimalOdds);
	      REQUIRE (rec.getWinProbabilityPercent() >= thresholds.minWinProbabilityPercent);
	      REQUIRE (rec.getWinProbabilityPercent() >= 0.0);
	      REQUIRE (rec.getWinProbabilityPercent() <= 100.0);

	      if (i > 0)
		{
		  if (category == RecommendationCategory::FavoriteParlays)
		    REQUIRE (rec.getWinProbabilityPercent() <= recs[i - 1].getWinProbabilityPercent());
		  else
		    REQUIRE (rec.getExpectedValuePercent() <= recs[i - 1].getExpectedValuePercent());
		}

	      if (category == RecommendationCategory::FavoriteParlays)
		{
		  std::set<std::string> labels;
		  for (const auto& leg : rec.getLegs())
		    labels.insert(leg.getLabel());
		  REQUIRE (labelSets.insert(labels).second);
		}
	    }
	}
    }
}

TEST_CASE ("Same seed, same recommendations", "[ParlayRecommender]")
{
  const auto pool = randomPool(30, 2026u);
  std::ostringstream log;

  TestRecommender first(RecommenderConfiguration::createDefault(), std::mt19937_64(424242u), log);
  TestRecommender second(RecommenderConfiguration::createDefault(), std::mt19937_64(424242u), log);

  auto a = first.getThreeLegParlays(pool);
  auto b = second.getThreeLegParlays(pool);

  REQUIRE (a.recommendations.size() == b.recommendations.size());
  for (std::size_t i = 0; i < a.recommendations.size(); ++i)
    {
      const auto& legsA = a.recommendations[i].getLegs();
      const auto& legsB = b.recommendations[i].getLegs();
      REQUIRE (legsA.size() == legsB.size());
      for (std::size_t j = 0; j < legsA.size(); ++j)
	REQUIRE (legsA[j].getId() == legsB[j].getId());
    }
}

TEST_CASE ("Default engine is usable without a seed", "[ParlayRecommender]")
{
  std::ostringstream log;
  ParlayRecommender<> recommender(RecommenderConfiguration::createDefault(), log);

  auto result = recommender.getTwoLegParlays({ makeOpportunity("1", "Chiefs", "NFL", 2.0),
					       makeOpportunity("2", "Bills", "NFL", 2.0) });
  REQUIRE (result.recommendations.size() == 1);
}

TEST_CASE ("Verbose mode narrates each category", "[ParlayRecommender]")
{
  auto config = RecommenderConfiguration::createDefault();
  config.setVerbose(true);

  std::ostringstream log;
  TestRecommender recommender(config, std::mt19937_64(1u), log);
  recommender.recommendAll({ makeOpportunity("1", "Chiefs", "NFL", 2.0),
			     makeOpportunity("bad", "Jets", "NFL", 0.9) });

  const std::string text = log.str();
  REQUIRE (text.find("Skipping opportunity bad") != std::string::npos);
  REQUIRE (text.find("favorite_parlays: window 1") != std::string::npos);
}
