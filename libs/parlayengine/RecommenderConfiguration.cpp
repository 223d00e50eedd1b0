// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "RecommenderConfiguration.h"
#include <fstream>
#include <sstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "ParlayException.h"

using namespace rapidjson;

namespace parlayrec
{
  namespace
  {
    CategoryThresholds singleBetDefaults()
    {
      CategoryThresholds t;
      t.minDecimalOdds = 2.0;
      t.minWinProbabilityPercent = 80.0;
      t.legCount = 1;
      return t;
    }

    CategoryThresholds twoLegDefaults()
    {
      CategoryThresholds t;
      t.minDecimalOdds = 4.0;
      t.minWinProbabilityPercent = 60.0;
      t.legCount = 2;
      t.candidateWindow = kTwoLegCandidateWindow;
      t.correlationIncrement = kTwoLegCorrelationIncrement;
      return t;
    }

    CategoryThresholds threeLegDefaults()
    {
      CategoryThresholds t;
      t.minDecimalOdds = 5.0;
      t.minWinProbabilityPercent = 60.0;
      t.legCount = 3;
      t.candidateWindow = kThreeLegCandidateWindow;
      t.maxAttempts = kMaxRandomDrawAttempts;
      t.correlationIncrement = kThreeLegCorrelationIncrement;
      return t;
    }

    CategoryThresholds favoriteDefaults()
    {
      CategoryThresholds t;
      t.minDecimalOdds = 3.0;
      t.minWinProbabilityPercent = 53.0;
      t.legCount = kDefaultFavoriteLegCount;
      t.candidateWindow = kFavoriteCandidateWindow;
      t.maxAttempts = kMaxRandomDrawAttempts;
      t.correlationIncrement = kFavoriteCorrelationIncrement;
      return t;
    }

    double readDouble(const Value& object, const char* key, double current, const std::string& context)
    {
      if (!object.HasMember(key))
	return current;

      const Value& v = object[key];
      if (!v.IsNumber())
	throw ConfigurationException("Configuration value '" + context + "." + key + "' must be a number");

      return v.GetDouble();
    }

    std::size_t readCount(const Value& object, const char* key, std::size_t current, const std::string& context)
    {
      if (!object.HasMember(key))
	return current;

      const Value& v = object[key];
      if (!v.IsUint())
	throw ConfigurationException("Configuration value '" + context + "." + key
				     + "' must be a non-negative integer");

      return static_cast<std::size_t>(v.GetUint());
    }

    void readThresholds(const Value& object, const std::string& context, CategoryThresholds& t)
    {
      if (!object.IsObject())
	throw ConfigurationException("Configuration section '" + context + "' must be an object");

      t.minDecimalOdds           = readDouble(object, "min_odds", t.minDecimalOdds, context);
      t.minWinProbabilityPercent = readDouble(object, "min_win_prob", t.minWinProbabilityPercent, context);
      t.maxResults               = readCount(object, "max_results", t.maxResults, context);
      t.legCount                 = readCount(object, "leg_count", t.legCount, context);
      t.candidateWindow          = readCount(object, "candidate_window", t.candidateWindow, context);
      t.maxAttempts              = readCount(object, "max_attempts", t.maxAttempts, context);
      t.correlationIncrement     = readDouble(object, "correlation_increment", t.correlationIncrement, context);
    }

    template <class Writer>
    void writeThresholds(Writer& writer, const CategoryThresholds& t)
    {
      writer.StartObject();
      writer.Key("min_odds");              writer.Double(t.minDecimalOdds);
      writer.Key("min_win_prob");          writer.Double(t.minWinProbabilityPercent);
      writer.Key("max_results");           writer.Uint64(t.maxResults);
      writer.Key("leg_count");             writer.Uint64(t.legCount);
      writer.Key("candidate_window");      writer.Uint64(t.candidateWindow);
      writer.Key("max_attempts");          writer.Uint64(t.maxAttempts);
      writer.Key("correlation_increment"); writer.Double(t.correlationIncrement);
      writer.EndObject();
    }
  }

  RecommenderConfiguration::RecommenderConfiguration()
    : mThresholds(),
      mProbabilityModel(),
      mSourceLimit(kDefaultSourceLimit),
      mVerbose(false)
  {
    mThresholds[RecommendationCategory::SingleBets]      = singleBetDefaults();
    mThresholds[RecommendationCategory::TwoLegParlays]   = twoLegDefaults();
    mThresholds[RecommendationCategory::ThreeLegParlays] = threeLegDefaults();
    mThresholds[RecommendationCategory::FavoriteParlays] = favoriteDefaults();
  }

  RecommenderConfiguration RecommenderConfiguration::createDefault()
  {
    return RecommenderConfiguration();
  }

  RecommenderConfiguration RecommenderConfiguration::loadFromFile(const std::string& configPath)
  {
    std::ifstream file(configPath);
    if (!file.is_open())
      throw ConfigurationException("Could not open configuration file: " + configPath);

    std::stringstream buffer;
    buffer << file.rdbuf();

    return loadFromString(buffer.str());
  }

  RecommenderConfiguration RecommenderConfiguration::loadFromString(const std::string& jsonContent)
  {
    RecommenderConfiguration config;

    Document doc;
    doc.Parse(jsonContent.c_str());

    if (doc.HasParseError())
      throw ConfigurationException(std::string("JSON parsing error: ")
				   + GetParseError_En(doc.GetParseError())
				   + " at offset " + std::to_string(doc.GetErrorOffset()));

    if (!doc.IsObject())
      throw ConfigurationException("Configuration root must be a JSON object");

    if (doc.HasMember("probability_model"))
      {
	const Value& model = doc["probability_model"];
	if (!model.IsObject())
	  throw ConfigurationException("Configuration section 'probability_model' must be an object");

	config.mProbabilityModel.boostFactor = readDouble(model, "boost_factor",
							  config.mProbabilityModel.boostFactor,
							  "probability_model");
	config.mProbabilityModel.ceiling = readDouble(model, "ceiling",
						      config.mProbabilityModel.ceiling,
						      "probability_model");
      }

    for (auto category : kAllCategories)
      {
	const std::string name = categoryName(category);
	if (doc.HasMember(name.c_str()))
	  readThresholds(doc[name.c_str()], name, config.mThresholds[category]);
      }

    config.mSourceLimit = readCount(doc, "source_limit", config.mSourceLimit, "root");

    if (doc.HasMember("verbose"))
      {
	if (!doc["verbose"].IsBool())
	  throw ConfigurationException("Configuration value 'root.verbose' must be true or false");
	config.mVerbose = doc["verbose"].GetBool();
      }

    return config;
  }

  void RecommenderConfiguration::saveToFile(const std::string& configPath) const
  {
    std::ofstream file(configPath);
    if (!file.is_open())
      throw ConfigurationException("Could not open file for writing: " + configPath);

    file << toJsonString();
  }

  std::string RecommenderConfiguration::toJsonString() const
  {
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("probability_model");
    writer.StartObject();
    writer.Key("boost_factor"); writer.Double(mProbabilityModel.boostFactor);
    writer.Key("ceiling");      writer.Double(mProbabilityModel.ceiling);
    writer.EndObject();

    for (const auto& [category, thresholds] : mThresholds)
      {
	const std::string name = categoryName(category);
	writer.Key(name.c_str());
	writeThresholds(writer, thresholds);
      }

    writer.Key("source_limit"); writer.Uint64(mSourceLimit);
    writer.Key("verbose");      writer.Bool(mVerbose);
    writer.EndObject();

    return std::string(buffer.GetString()) + "\n";
  }

  std::vector<std::string> RecommenderConfiguration::validate() const
  {
    std::vector<std::string> errors;

    if (!(mProbabilityModel.boostFactor > 0.0))
      errors.push_back("probability_model.boost_factor must be positive");

    if (!(mProbabilityModel.ceiling > 0.0 && mProbabilityModel.ceiling <= 1.0))
      errors.push_back("probability_model.ceiling must lie in (0, 1]");

    for (const auto& [category, t] : mThresholds)
      {
	const std::string name = categoryName(category);

	if (t.legCount == 0)
	  errors.push_back(name + ".leg_count must be at least 1");

	if (category == RecommendationCategory::SingleBets && t.legCount != 1)
	  errors.push_back(name + ".leg_count must be 1");

	if (category == RecommendationCategory::TwoLegParlays && t.legCount != 2)
	  errors.push_back(name + ".leg_count must be 2");

	if (category == RecommendationCategory::ThreeLegParlays && t.legCount != 3)
	  errors.push_back(name + ".leg_count must be 3");

	if (t.maxResults == 0)
	  errors.push_back(name + ".max_results must be at least 1");

	if (t.minWinProbabilityPercent < 0.0 || t.minWinProbabilityPercent > 100.0)
	  errors.push_back(name + ".min_win_prob must lie in [0, 100]");

	if (t.candidateWindow != 0 && t.candidateWindow < t.legCount)
	  errors.push_back(name + ".candidate_window is smaller than leg_count; the category can never produce a grouping");

	if ((category == RecommendationCategory::ThreeLegParlays ||
	     category == RecommendationCategory::FavoriteParlays) && t.maxAttempts == 0)
	  errors.push_back(name + ".max_attempts must be at least 1 for a sampled category");

	if (t.correlationIncrement < 0.0)
	  errors.push_back(name + ".correlation_increment must not be negative");

	if (t.legCount > 1)
	  {
	    const double worstPenalty = t.correlationIncrement * static_cast<double>(t.legCount - 1);
	    if (worstPenalty >= 1.0)
	      errors.push_back(name + ".correlation_increment allows a penalty of "
			       + std::to_string(worstPenalty)
			       + " which can drive the combined probability negative");
	  }
      }

    return errors;
  }

  const CategoryThresholds& RecommenderConfiguration::getThresholds(RecommendationCategory category) const
  {
    return mThresholds.at(category);
  }

  void RecommenderConfiguration::setThresholds(RecommendationCategory category,
					       const CategoryThresholds& thresholds)
  {
    mThresholds[category] = thresholds;
  }
}
