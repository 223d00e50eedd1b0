// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PARLAY_RECOMMENDER_H
#define __PARLAY_RECOMMENDER_H 1

#include <exception>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>
#include "randutils.hpp"
#include "GroupingGenerators.h"
#include "OpportunitySource.h"
#include "ProbabilityResolver.h"
#include "Recommendation.h"
#include "RecommenderConfiguration.h"
#include "diagnostics/DiagnosticSubject.h"

namespace parlayrec
{
  /**
   * @class ParlayRecommender
   * @brief Produces ranked single bets and parlays from a pool of opportunities.
   *
   * Each call works on a private copy of the caller's records. The only state
   * carried between calls is the random source used by the sampled
   * categories (three-leg and favorite parlays).
   *
   * Diagnostic events are sent to attached observers and every failure is
   * also written to the log stream.
   *
   * @tparam Rng random source; randutils::mt19937_rng is auto-seeded, tests
   *         typically inject a seeded std::mt19937_64
   */
  template <class Rng = randutils::mt19937_rng>
  class ParlayRecommender : public diagnostics::DiagnosticSubject
  {
  public:
    explicit ParlayRecommender(const RecommenderConfiguration& config = RecommenderConfiguration::createDefault(),
			       std::ostream& log = std::cout)
      : mConfig(config),
	mResolver(config.getProbabilityModel()),
	mRng(),
	mLog(log)
    {}

    ParlayRecommender(const RecommenderConfiguration& config,
		      Rng rng,
		      std::ostream& log = std::cout)
      : mConfig(config),
	mResolver(config.getProbabilityModel()),
	mRng(std::move(rng)),
	mLog(log)
    {}

    ParlayRecommender(const ParlayRecommender&) = delete;
    ParlayRecommender& operator=(const ParlayRecommender&) = delete;

    /**
     * @brief Run every category generator with the configured thresholds.
     *
     * Each category resolves probabilities and generates inside its own
     * failure boundary. An exception leaves that category empty and is
     * reported as a CategoryFailure; the remaining categories still run.
     * Rejected records are reported once per call.
     */
    RecommendationSet recommendAll(const std::vector<Opportunity>& opportunities)
    {
      RecommendationSet results;
      bool rejectionsPending = true;

      for (auto category : kAllCategories)
	{
	  try
	    {
	      const auto pool = resolvePool(opportunities, rejectionsPending);
	      rejectionsPending = false;

	      CategoryResult result = generate(category, pool, mConfig.getThresholds(category));
	      result.summary.setRecordsSupplied(opportunities.size());
	      reportOutcome(category, result);
	      results.setResult(category, std::move(result));
	    }
	  catch (const std::exception& e)
	    {
	      mLog << "Error generating " << categoryName(category) << ": " << e.what() << std::endl;
	      notifyGuarded(diagnostics::DiagnosticEventType::CategoryFailure, category, "",
			    "EXCEPTION", e.what(), 0);
	    }
	}

      return results;
    }

    /// Reads up to the configured source limit (default 30) and aggregates.
    RecommendationSet recommendFromSource(OpportunitySource& source)
    {
      return recommendFromSource(source, mConfig.getSourceLimit());
    }

    /**
     * @brief Read up to limit records from the source and aggregate.
     *
     * A source that throws, whatever it throws, yields a result with every
     * category empty.
     */
    RecommendationSet recommendFromSource(OpportunitySource& source, std::size_t limit)
    {
      std::vector<Opportunity> opportunities;

      try
	{
	  opportunities = source.getOpenOpportunities(limit);
	}
      catch (const std::exception& e)
	{
	  mLog << "Error reading opportunities: " << e.what() << std::endl;
	  notifyGuarded(diagnostics::DiagnosticEventType::DataSourceFailure, std::nullopt, "",
			"EXCEPTION", e.what(), 0);
	  return RecommendationSet();
	}
      catch (...)
	{
	  mLog << "Error reading opportunities: unknown exception" << std::endl;
	  notifyGuarded(diagnostics::DiagnosticEventType::DataSourceFailure, std::nullopt, "",
			"UNKNOWN", "non-standard exception from the data source", 0);
	  return RecommendationSet();
	}

      if (mConfig.isVerbose())
	mLog << "Read " << opportunities.size() << " opportunities (limit " << limit << ")" << std::endl;

      return recommendAll(opportunities);
    }

    /**
     * @brief Aggregate over the records whose category tag equals categoryTag.
     *
     * An empty tag means no filtering.
     */
    RecommendationSet recommendForCategoryTag(const std::vector<Opportunity>& opportunities,
					      const std::string& categoryTag)
    {
      if (categoryTag.empty())
	return recommendAll(opportunities);

      std::vector<Opportunity> filtered;
      for (const auto& opportunity : opportunities)
	{
	  if (opportunity.getCategoryTag() == categoryTag)
	    filtered.push_back(opportunity);
	}

      if (mConfig.isVerbose())
	mLog << filtered.size() << " of " << opportunities.size()
	     << " opportunities tagged " << categoryTag << std::endl;

      return recommendAll(filtered);
    }

    CategoryResult getSingleBets(const std::vector<Opportunity>& opportunities)
    {
      return runCategory(RecommendationCategory::SingleBets, opportunities,
			 mConfig.getThresholds(RecommendationCategory::SingleBets));
    }

    CategoryResult getTwoLegParlays(const std::vector<Opportunity>& opportunities)
    {
      return runCategory(RecommendationCategory::TwoLegParlays, opportunities,
			 mConfig.getThresholds(RecommendationCategory::TwoLegParlays));
    }

    CategoryResult getThreeLegParlays(const std::vector<Opportunity>& opportunities)
    {
      return runCategory(RecommendationCategory::ThreeLegParlays, opportunities,
			 mConfig.getThresholds(RecommendationCategory::ThreeLegParlays));
    }

    CategoryResult getFavoriteParlays(const std::vector<Opportunity>& opportunities)
    {
      return runCategory(RecommendationCategory::FavoriteParlays, opportunities,
			 mConfig.getThresholds(RecommendationCategory::FavoriteParlays));
    }

    /**
     * @brief Favorite parlays with caller supplied leg count and thresholds.
     *
     * Window, attempt budget and correlation increment come from the
     * configuration.
     *
     * @param minWinProbabilityPercent percent, 0-100
     */
    CategoryResult getFavoriteParlays(const std::vector<Opportunity>& opportunities,
				      std::size_t legCount,
				      double minDecimalOdds,
				      double minWinProbabilityPercent)
    {
      CategoryThresholds thresholds = mConfig.getThresholds(RecommendationCategory::FavoriteParlays);
      thresholds.legCount = legCount;
      thresholds.minDecimalOdds = minDecimalOdds;
      thresholds.minWinProbabilityPercent = minWinProbabilityPercent;

      return runCategory(RecommendationCategory::FavoriteParlays, opportunities, thresholds);
    }

    const RecommenderConfiguration& getConfiguration() const
    {
      return mConfig;
    }

    Rng& getRng()
    {
      return mRng;
    }

  private:
    CategoryResult runCategory(RecommendationCategory category,
			       const std::vector<Opportunity>& opportunities,
			       const CategoryThresholds& thresholds)
    {
      const auto pool = resolvePool(opportunities, true);

      CategoryResult result = generate(category, pool, thresholds);
      result.summary.setRecordsSupplied(opportunities.size());
      reportOutcome(category, result);
      return result;
    }

    // Rejections are per record, so an observer failing on one does not fail the category.
    std::vector<ResolvedOpportunity> resolvePool(const std::vector<Opportunity>& opportunities,
						 bool reportRejections)
    {
      ResolutionResult resolution = mResolver.resolve(opportunities);

      if (reportRejections)
	{
	  for (const auto& rejected : resolution.rejected)
	    {
	      if (mConfig.isVerbose())
		mLog << "Skipping opportunity " << rejected.id << ": " << rejected.message << std::endl;

	      notifyGuarded(diagnostics::DiagnosticEventType::RecordRejected, std::nullopt, rejected.id,
			    resolutionFailureCode(rejected.reason), rejected.message, 0);
	    }
	}

      return std::move(resolution.resolved);
    }

    CategoryResult generate(RecommendationCategory category,
			    const std::vector<ResolvedOpportunity>& pool,
			    const CategoryThresholds& thresholds)
    {
      switch (category)
	{
	case RecommendationCategory::SingleBets:
	  return generators::generateSingleBets(pool, thresholds);
	case RecommendationCategory::TwoLegParlays:
	  return generators::generateTwoLegParlays(pool, thresholds);
	case RecommendationCategory::ThreeLegParlays:
	  return generators::generateThreeLegParlays(pool, thresholds, mRng);
	case RecommendationCategory::FavoriteParlays:
	  return generators::generateFavoriteParlays(pool, thresholds, mRng);
	}

      throw std::invalid_argument("ParlayRecommender: unknown recommendation category");
    }

    void reportOutcome(RecommendationCategory category, const CategoryResult& result)
    {
      const GenerationSummary& summary = result.summary;

      if (mConfig.isVerbose())
	mLog << categoryName(category) << ": window " << summary.getWindowSize()
	     << ", evaluated " << summary.getCandidatesEvaluated()
	     << ", draws " << summary.getRandomDraws()
	     << ", accepted " << summary.getAcceptedCount()
	     << ", returned " << result.recommendations.size() << std::endl;

      if (summary.isInsufficientPool())
	{
	  notify(diagnostics::DiagnosticEventType::InsufficientPool, category, "",
		 "POOL_SMALLER_THAN_LEG_COUNT",
		 "only " + std::to_string(summary.getWindowSize()) + " candidates available",
		 summary.getWindowSize());
	}
      else if (result.recommendations.empty())
	{
	  notify(diagnostics::DiagnosticEventType::NoQualifyingGroupings, category, "",
		 "THRESHOLDS_NOT_MET",
		 std::to_string(summary.getCandidatesEvaluated()) + " candidates evaluated",
		 summary.getCandidatesEvaluated());
	}
      else
	{
	  notify(diagnostics::DiagnosticEventType::CategoryCompleted, category, "",
		 "", std::to_string(result.recommendations.size()) + " recommendations",
		 result.recommendations.size());
	}
    }

    void notify(diagnostics::DiagnosticEventType type,
		std::optional<RecommendationCategory> category,
		const std::string& opportunityId,
		const std::string& reason,
		const std::string& message,
		std::size_t count)
    {
      notifyObservers(diagnostics::RecommendationDiagnosticRecord(type, category, opportunityId,
								  reason, message, count));
    }

    /// Used on failure paths; an observer error is logged instead of propagated.
    void notifyGuarded(diagnostics::DiagnosticEventType type,
		       std::optional<RecommendationCategory> category,
		       const std::string& opportunityId,
		       const std::string& reason,
		       const std::string& message,
		       std::size_t count)
    {
      try
	{
	  notify(type, category, opportunityId, reason, message, count);
	}
      catch (const std::exception& e)
	{
	  mLog << "Error reporting " << diagnostics::eventTypeToString(type)
	       << " diagnostic: " << e.what() << std::endl;
	}
    }

  private:
    RecommenderConfiguration mConfig;
    ProbabilityResolver mResolver;
    Rng mRng;
    std::ostream& mLog;
  };
}

#endif
