// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "OddsConversion.h"
#include <cmath>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include "ParlayException.h"

namespace parlayrec
{
  namespace odds
  {
    namespace
    {
      std::optional<double> parseNumber(const std::string& text)
      {
	if (text.empty())
	  return std::nullopt;

	try
	  {
	    std::size_t consumed = 0;
	    double value = std::stod(text, &consumed);

	    if (consumed != text.size() || !std::isfinite(value))
	      return std::nullopt;

	    return value;
	  }
	catch (const std::invalid_argument&)
	  {
	    return std::nullopt;
	  }
	catch (const std::out_of_range&)
	  {
	    return std::nullopt;
	  }
      }
    }

    double impliedProbability(double decimalOdds)
    {
      if (!std::isfinite(decimalOdds) || decimalOdds <= 0.0)
	throw InvalidOpportunityException("impliedProbability: decimal odds must be positive and finite, got "
					  + std::to_string(decimalOdds));

      return 1.0 / decimalOdds;
    }

    std::optional<double> americanToDecimal(const std::string& americanOdds)
    {
      const std::string text = boost::algorithm::trim_copy(americanOdds);
      if (text.size() < 2 || (text[0] != '+' && text[0] != '-'))
	return std::nullopt;

      auto magnitude = parseNumber(text.substr(1));
      if (!magnitude || *magnitude <= 0.0)
	return std::nullopt;

      if (text[0] == '+')
	return (*magnitude / 100.0) + 1.0;
      else
	return (100.0 / *magnitude) + 1.0;
    }

    std::optional<double> parseOdds(const std::string& oddsText)
    {
      const std::string text = boost::algorithm::trim_copy(oddsText);
      if (text.empty())
	return std::nullopt;

      if (text[0] == '+' || text[0] == '-')
	{
	  auto signedValue = parseNumber(text);
	  if (!signedValue)
	    return std::nullopt;

	  if (std::fabs(*signedValue) >= 100.0)
	    return americanToDecimal(text);

	  return signedValue;
	}

      return parseNumber(text);
    }

    std::string decimalToAmerican(double decimalOdds)
    {
      if (!std::isfinite(decimalOdds) || decimalOdds <= 1.0)
	throw InvalidOpportunityException("decimalToAmerican: decimal odds must exceed 1.0, got "
					  + std::to_string(decimalOdds));

      if (decimalOdds >= 2.0)
	return "+" + std::to_string(std::lround((decimalOdds - 1.0) * 100.0));
      else
	return "-" + std::to_string(std::lround(100.0 / (decimalOdds - 1.0)));
    }
  }
}
