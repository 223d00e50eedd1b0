// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PARLAY_EXCEPTION_H
#define __PARLAY_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace parlayrec
{
  class ParlayException : public std::runtime_error
  {
  public:
    ParlayException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~ParlayException() = default;
  };

  // Odds that have no probability or display form (not finite, or <= 1.0)
  class InvalidOpportunityException : public ParlayException
  {
  public:
      explicit InvalidOpportunityException(const std::string& msg)
        : ParlayException(msg) {}
  };

  class DataSourceException : public ParlayException
  {
  public:
      explicit DataSourceException(const std::string& msg)
        : ParlayException(msg) {}
  };

  class ConfigurationException : public ParlayException
  {
  public:
      explicit ConfigurationException(const std::string& msg)
        : ParlayException(msg) {}
  };

} // namespace parlayrec

#endif // __PARLAY_EXCEPTION_H
