// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ODDS_CONVERSION_H
#define __ODDS_CONVERSION_H 1

#include <string>
#include <optional>

namespace parlayrec
{
  namespace odds
  {
    /**
     * @brief Break-even win probability 1 / decimalOdds.
     * @throws InvalidOpportunityException if decimalOdds is not finite or not positive.
     */
    double impliedProbability(double decimalOdds);

    /**
     * @brief Convert American odds text ("+120", "-110") to decimal odds.
     * @return std::nullopt when the text is not a signed number or is a zero line.
     */
    std::optional<double> americanToDecimal(const std::string& americanOdds);

    /**
     * @brief Parse odds text as supplied by a data source.
     *
     * Sign-prefixed values with a magnitude of at least 100 are read as American
     * odds. Anything else is read as a decimal multiplier, so "+1.93" is 1.93.
     * Non-numeric text yields std::nullopt. No range check is made here; a
     * multiplier <= 1.0 is rejected later by ProbabilityResolver.
     */
    std::optional<double> parseOdds(const std::string& oddsText);

    /**
     * @brief Display string for decimal odds in American format.
     *
     * decimalOdds >= 2.0 gives "+" followed by round((decimalOdds - 1) * 100),
     * otherwise "-" followed by round(100 / (decimalOdds - 1)).
     *
     * @throws InvalidOpportunityException if decimalOdds <= 1.0 (no American line exists)
     */
    std::string decimalToAmerican(double decimalOdds);
  }
}

#endif
