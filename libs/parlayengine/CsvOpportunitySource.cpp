// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "CsvOpportunitySource.h"
#include <fstream>
#include <boost/lexical_cast.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "csv.h"
#include "OddsConversion.h"
#include "ParlayException.h"

namespace parlayrec
{
  namespace
  {
    std::optional<double> parseProbability(const std::string& text)
    {
      if (text.empty())
	return std::nullopt;

      try
	{
	  return boost::lexical_cast<double>(text);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  return std::nullopt;
	}
    }

    boost::posix_time::ptime parseEventTime(const std::string& text)
    {
      if (text.empty())
	return boost::posix_time::ptime(boost::posix_time::not_a_date_time);

      try
	{
	  return boost::posix_time::time_from_string(text);
	}
      catch (const std::exception&)
	{
	  // event time is informational only
	  return boost::posix_time::ptime(boost::posix_time::not_a_date_time);
	}
    }
  }

  CsvOpportunitySource::CsvOpportunitySource(const std::string& fileName)
    : mFileName(fileName)
  {
    std::ifstream fin(mFileName);
    if (!fin.is_open())
      throw DataSourceException("Cannot open opportunity file: " + mFileName);
  }

  std::vector<Opportunity> CsvOpportunitySource::getOpenOpportunities(std::size_t limit)
  {
    std::vector<Opportunity> opportunities;
    if (limit == 0)
      return opportunities;

    try
      {
	io::CSVReader<7, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> csvFile(mFileName);

	csvFile.read_header(io::ignore_missing_column | io::ignore_extra_column,
			    "Id", "Label", "Category", "Odds", "Probability", "EventTime", "Description");

	for (const char* required : {"Id", "Label", "Category", "Odds"})
	  {
	    if (!csvFile.has_column(required))
	      throw DataSourceException("Opportunity file " + mFileName
					+ " has no '" + required + "' column");
	  }

	std::string id, label, category, oddsText, probabilityText, eventTimeText, description;

	while (opportunities.size() < limit)
	  {
	    // missing optional columns leave their variables untouched
	    probabilityText.clear();
	    eventTimeText.clear();
	    description.clear();

	    if (!csvFile.read_row(id, label, category, oddsText, probabilityText,
				  eventTimeText, description))
	      break;

	    Opportunity opportunity(id, label, category,
				    odds::parseOdds(oddsText),
				    parseProbability(probabilityText));
	    opportunity.setDescription(description);
	    opportunity.setEventTime(parseEventTime(eventTimeText));

	    opportunities.push_back(std::move(opportunity));
	  }
      }
    catch (const io::error::base& e)
      {
	throw DataSourceException("Error reading opportunity file " + mFileName + ": " + e.what());
      }

    return opportunities;
  }
}
