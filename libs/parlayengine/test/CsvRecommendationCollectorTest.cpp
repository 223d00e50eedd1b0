#include <catch2/catch.hpp>
#include <fstream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "diagnostics/CsvRecommendationCollector.h"
#include "diagnostics/DiagnosticSubject.h"
#include "diagnostics/NullRecommendationCollector.h"

using namespace parlayrec;
using namespace parlayrec::diagnostics;
namespace fs = boost::filesystem;

namespace
{
  std::vector<std::string> readLines(const std::string& path)
  {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
      lines.push_back(line);
    return lines;
  }
}

TEST_CASE ("CsvRecommendationCollector writes the header once", "[diagnostics]")
{
  const auto path = fs::temp_directory_path() / fs::unique_path("parlay-diag-%%%%-%%%%.csv");

  {
    CsvRecommendationCollector collector(path.string());
    collector.onDiagnosticEvent(RecommendationDiagnosticRecord(DiagnosticEventType::RecordRejected,
							       std::nullopt, "op7", "ODDS_NOT_ABOVE_ONE",
							       "decimal odds 1 do not exceed 1.0", 0));
  }

  {
    CsvRecommendationCollector collector(path.string());
    collector.onDiagnosticEvent(RecommendationDiagnosticRecord(DiagnosticEventType::CategoryCompleted,
							       RecommendationCategory::TwoLegParlays, "", "",
							       "3 recommendations", 3));
  }

  auto lines = readLines(path.string());
  fs::remove(path);

  REQUIRE (lines.size() == 3);
  REQUIRE (lines[0] == "Event,Category,OpportunityID,Reason,Count,Message");
  REQUIRE (lines[1] == "RECORD_REJECTED,,\"op7\",ODDS_NOT_ABOVE_ONE,0,\"decimal odds 1 do not exceed 1.0\"");
  REQUIRE (lines[2] == "CATEGORY_COMPLETED,two_leg_parlays,\"\",,3,\"3 recommendations\"");
}

TEST_CASE ("DiagnosticSubject fans out to attached observers", "[diagnostics]")
{
  DiagnosticSubject subject;
  NullRecommendationCollector a;
  NullRecommendationCollector b;

  subject.attach(&a);
  subject.attach(&b);
  subject.attach(nullptr);
  REQUIRE (subject.getNumObservers() == 2);

  REQUIRE_NOTHROW (subject.notifyObservers(RecommendationDiagnosticRecord(DiagnosticEventType::DataSourceFailure,
									  std::nullopt, "", "EXCEPTION",
									  "timeout", 0)));

  subject.detach(&a);
  REQUIRE (subject.getNumObservers() == 1);
}

TEST_CASE ("Event type names", "[diagnostics]")
{
  REQUIRE (eventTypeToString(DiagnosticEventType::InsufficientPool) == "INSUFFICIENT_POOL");
  REQUIRE (eventTypeToString(DiagnosticEventType::NoQualifyingGroupings) == "NO_QUALIFYING_GROUPINGS");
  REQUIRE (eventTypeToString(DiagnosticEventType::CategoryFailure) == "CATEGORY_FAILURE");
}
