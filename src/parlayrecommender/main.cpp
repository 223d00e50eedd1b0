#include <cstdint>
#include <iostream>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include "ParlayRecommender.h"
#include "CsvOpportunitySource.h"
#include "ParlayException.h"
#include "RecommenderConfiguration.h"
#include "RngUtils.h"
#include "ValueBetAnalyzer.h"
#include "diagnostics/CsvRecommendationCollector.h"
#include "reporting/RecommendationReporter.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace parlayrec;
using parlayrecommender::reporting::RecommendationReporter;
using parlayrecommender::utils::TeeStream;

namespace
{
  struct RunOptions
  {
    std::string categoryTag;
    std::size_t limit;
    std::string diagnosticsPath;
    bool valueBets = false;
    double minEdge = ValueBetAnalyzer::kDefaultMinEdge;
    double confidenceThreshold = ValueBetAnalyzer::kDefaultConfidenceThreshold;
  };

  void printUsage(const po::options_description& desc)
  {
    std::cout << "Parlay Recommender - ranked single bets and parlays from open opportunities\n\n";
    std::cout << "Usage: parlayrecommender --opportunities <file.csv> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  parlayrecommender --opportunities open_bets.csv\n";
    std::cout << "  parlayrecommender --opportunities open_bets.csv --category NFL --legs 4\n";
    std::cout << "  parlayrecommender --opportunities open_bets.csv --config thresholds.json --seed 42\n";
    std::cout << "  parlayrecommender --opportunities open_bets.csv --value-bets --min-edge 0.08\n";
  }

  // Value bets need a supplied Probability column; records without one are skipped.
  int runValueBets(CsvOpportunitySource& source, const RunOptions& options, std::ostream& log)
  {
    std::vector<Opportunity> opportunities;
    try
      {
	opportunities = source.getOpenOpportunities(options.limit);
      }
    catch (const ParlayException& e)
      {
	log << "Error reading opportunities: " << e.what() << std::endl;
	return 1;
      }

    ValueBetAnalyzer analyzer(options.confidenceThreshold, options.minEdge);
    auto valueBets = analyzer.findBestValueBets(opportunities);

    log << std::endl;
    RecommendationReporter::writeValueBets(log, valueBets, analyzer.suggestParlay(valueBets));
    return 0;
  }

  template <class Rng>
  int runRecommendations(ParlayRecommender<Rng>& recommender,
			 CsvOpportunitySource& source,
			 const RunOptions& options,
			 std::ostream& log)
  {
    std::unique_ptr<diagnostics::CsvRecommendationCollector> collector;
    if (!options.diagnosticsPath.empty())
      {
	collector = std::make_unique<diagnostics::CsvRecommendationCollector>(options.diagnosticsPath);
	recommender.attach(collector.get());
      }

    RecommendationSet results;

    if (options.categoryTag.empty())
      {
	results = recommender.recommendFromSource(source, options.limit);
      }
    else
      {
	std::vector<Opportunity> opportunities;
	try
	  {
	    opportunities = source.getOpenOpportunities(options.limit);
	  }
	catch (const ParlayException& e)
	  {
	    log << "Error reading opportunities: " << e.what() << std::endl;
	    return 1;
	  }

	results = recommender.recommendForCategoryTag(opportunities, options.categoryTag);
      }

    if (collector)
      recommender.detach(collector.get());

    RecommendationReporter::writeReport(log, results);

    if (options.valueBets)
      return runValueBets(source, options, log);

    return 0;
  }
}

int main(int argc, char* argv[])
{
  try
    {
      po::options_description desc("Options");
      desc.add_options()
	("help,h", "Show help message")
	("opportunities,o", po::value<std::string>(), "CSV file of open opportunities (Id,Label,Category,Odds[,Probability][,EventTime][,Description])")
	("config,c", po::value<std::string>(), "JSON configuration file; defaults are used when omitted")
	("write-config", po::value<std::string>(), "Write the effective configuration as JSON and exit")
	("limit,l", po::value<std::size_t>(), "Maximum number of opportunities to read (default 30)")
	("category", po::value<std::string>(), "Only use opportunities with this category tag, e.g. NFL")
	("legs", po::value<std::size_t>(), "Leg count for favorite parlays (default 6)")
	("seed", po::value<std::uint64_t>(), "Seed the random draws for a reproducible run")
	("diagnostics", po::value<std::string>(), "Append diagnostic events to this CSV file")
	("log", po::value<std::string>(), "Mirror the report to this log file")
	("log-dir", po::value<std::string>(), "Mirror the report to a time stamped log file in this directory")
	("value-bets", "Also list value bets from records that supply a Probability")
	("min-edge", po::value<double>(), "Minimum edge for a value bet, 0-1 (default 0.05)")
	("confidence", po::value<double>(), "Minimum true probability for a value bet, 0-1 (default 0.6)")
	("verbose,v", "Verbose output");

      po::variables_map vm;
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);

      if (vm.count("help"))
	{
	  printUsage(desc);
	  return 0;
	}

      RecommenderConfiguration config = RecommenderConfiguration::createDefault();
      if (vm.count("config"))
	{
	  const std::string configPath = vm["config"].as<std::string>();
	  if (!fs::exists(configPath))
	    {
	      std::cerr << "Error: configuration file not found: " << configPath << std::endl;
	      return 1;
	    }
	  config = RecommenderConfiguration::loadFromFile(configPath);
	}

      if (vm.count("verbose"))
	config.setVerbose(true);

      if (vm.count("limit"))
	config.setSourceLimit(vm["limit"].as<std::size_t>());

      if (vm.count("legs"))
	{
	  CategoryThresholds favorites = config.getThresholds(RecommendationCategory::FavoriteParlays);
	  favorites.legCount = vm["legs"].as<std::size_t>();
	  config.setThresholds(RecommendationCategory::FavoriteParlays, favorites);
	}

      const auto errors = config.validate();
      if (!errors.empty())
	{
	  std::cerr << "Configuration errors:" << std::endl;
	  for (const auto& error : errors)
	    std::cerr << "  - " << error << std::endl;
	  return 1;
	}

      if (vm.count("write-config"))
	{
	  config.saveToFile(vm["write-config"].as<std::string>());
	  std::cout << "Configuration written to " << vm["write-config"].as<std::string>() << std::endl;
	  return 0;
	}

      if (!vm.count("opportunities"))
	{
	  std::cerr << "Error: --opportunities is required" << std::endl;
	  printUsage(desc);
	  return 1;
	}

      const std::string opportunitiesPath = vm["opportunities"].as<std::string>();
      if (!fs::exists(opportunitiesPath))
	{
	  std::cerr << "Error: opportunity file not found: " << opportunitiesPath << std::endl;
	  return 1;
	}

      std::string logPath;
      if (vm.count("log"))
	logPath = vm["log"].as<std::string>();
      else if (vm.count("log-dir"))
	logPath = parlayrecommender::utils::createLogFileName(vm["log-dir"].as<std::string>());

      std::ofstream logFile;
      std::unique_ptr<TeeStream> tee;
      if (!logPath.empty())
	{
	  logFile.open(logPath);
	  if (!logFile.is_open())
	    {
	      std::cerr << "Error: cannot open log file: " << logPath << std::endl;
	      return 1;
	    }
	  tee = std::make_unique<TeeStream>(std::cout, logFile);
	}
      std::ostream& log = tee ? static_cast<std::ostream&>(*tee) : std::cout;

      RunOptions options;
      options.categoryTag = vm.count("category") ? vm["category"].as<std::string>() : std::string();
      options.limit = config.getSourceLimit();
      options.diagnosticsPath = vm.count("diagnostics") ? vm["diagnostics"].as<std::string>() : std::string();
      options.valueBets = vm.count("value-bets") > 0;
      if (vm.count("min-edge"))
	options.minEdge = vm["min-edge"].as<double>();
      if (vm.count("confidence"))
	options.confidenceThreshold = vm["confidence"].as<double>();

      if (config.isVerbose())
	log << "Run started " << parlayrecommender::utils::getCurrentTimestamp() << std::endl;

      CsvOpportunitySource source(opportunitiesPath);

      if (vm.count("seed"))
	{
	  const auto seed = vm["seed"].as<std::uint64_t>();
	  ParlayRecommender<std::mt19937_64> recommender(config,
							 rng_utils::make_seeded_engine<std::mt19937_64>(seed),
							 log);
	  return runRecommendations(recommender, source, options, log);
	}

      ParlayRecommender<> recommender(config, log);
      return runRecommendations(recommender, source, options, log);
    }
  catch (const po::error& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
  catch (const ParlayException& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
  catch (const std::exception& e)
    {
      std::cerr << "Unexpected error: " << e.what() << std::endl;
      return 1;
    }
}
