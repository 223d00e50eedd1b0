// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __CSV_OPPORTUNITY_SOURCE_H
#define __CSV_OPPORTUNITY_SOURCE_H 1

#include <string>
#include "OpportunitySource.h"

namespace parlayrec
{
  /**
   * @class CsvOpportunitySource
   * @brief Reads open opportunities from a CSV file.
   *
   * The file format is (header row required, column order free):
   * Id, Label, Category, Odds [, Probability] [, EventTime] [, Description]
   *
   * Odds may be decimal ("1.85") or American ("+120", "-110"). Odds that do
   * not parse are loaded as missing and dropped during probability
   * resolution. EventTime uses the "YYYY-MM-DD HH:MM:SS" form.
   *
   * The file is re-read on every call.
   */
  class CsvOpportunitySource : public OpportunitySource
  {
  public:
    /**
     * @throws DataSourceException if the file cannot be opened
     */
    explicit CsvOpportunitySource(const std::string& fileName);

    /**
     * @throws DataSourceException if a required column is missing or the
     *         file is structurally malformed
     */
    std::vector<Opportunity> getOpenOpportunities(std::size_t limit) override;

    const std::string& getFileName() const
    {
      return mFileName;
    }

  private:
    std::string mFileName;
  };
}

#endif
