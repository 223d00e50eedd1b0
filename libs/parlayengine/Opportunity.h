// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __OPPORTUNITY_H
#define __OPPORTUNITY_H 1

#include <string>
#include <optional>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace parlayrec
{
  /**
   * @class Opportunity
   * @brief A single wagering opportunity as supplied by the caller or a data source.
   *
   * The decimal odds and the win probability are both optional. Records are
   * validated when probabilities are resolved (see ProbabilityResolver), not
   * when they are constructed, so a data source can hand over whatever it read.
   *
   * Decimal odds of 2.0 mean a winning stake is doubled.
   */
  class Opportunity
  {
  public:
    Opportunity (const std::string& id,
		 const std::string& label,
		 const std::string& categoryTag,
		 std::optional<double> decimalOdds,
		 std::optional<double> winProbability = std::nullopt)
      : mId(id),
	mLabel(label),
	mCategoryTag(categoryTag),
	mDecimalOdds(decimalOdds),
	mWinProbability(winProbability),
	mDescription(),
	mEventTime(boost::posix_time::not_a_date_time)
    {}

    Opportunity (const Opportunity& rhs) = default;
    Opportunity (Opportunity&& rhs) noexcept = default;
    Opportunity& operator=(const Opportunity& rhs) = default;
    Opportunity& operator=(Opportunity&& rhs) noexcept = default;
    ~Opportunity() = default;

    const std::string& getId() const
    {
      return mId;
    }

    /// Participant or team name. Two legs with the same label describe the same outcome.
    const std::string& getLabel() const
    {
      return mLabel;
    }

    /// Domain of the outcome, e.g. the sport.
    const std::string& getCategoryTag() const
    {
      return mCategoryTag;
    }

    const std::optional<double>& getDecimalOdds() const
    {
      return mDecimalOdds;
    }

    const std::optional<double>& getWinProbability() const
    {
      return mWinProbability;
    }

    const std::string& getDescription() const
    {
      return mDescription;
    }

    void setDescription(const std::string& description)
    {
      mDescription = description;
    }

    /// not_a_date_time when the source did not supply one
    const boost::posix_time::ptime& getEventTime() const
    {
      return mEventTime;
    }

    void setEventTime(const boost::posix_time::ptime& eventTime)
    {
      mEventTime = eventTime;
    }

  private:
    std::string mId;
    std::string mLabel;
    std::string mCategoryTag;
    std::optional<double> mDecimalOdds;
    std::optional<double> mWinProbability;
    std::string mDescription;
    boost::posix_time::ptime mEventTime;
  };

  /**
   * @class ResolvedOpportunity
   * @brief An Opportunity copied out of the caller's pool and annotated with a
   *        usable probability.
   *
   * Invariants established by ProbabilityResolver: decimal odds are present,
   * finite and > 1.0; the probability lies in (0, 1].
   */
  class ResolvedOpportunity
  {
  public:
    ResolvedOpportunity (const Opportunity& opportunity,
			 double decimalOdds,
			 double probability,
			 bool probabilityEstimated)
      : mOpportunity(opportunity),
	mDecimalOdds(decimalOdds),
	mProbability(probability),
	mProbabilityEstimated(probabilityEstimated)
    {}

    const Opportunity& getOpportunity() const
    {
      return mOpportunity;
    }

    const std::string& getId() const
    {
      return mOpportunity.getId();
    }

    const std::string& getLabel() const
    {
      return mOpportunity.getLabel();
    }

    const std::string& getCategoryTag() const
    {
      return mOpportunity.getCategoryTag();
    }

    double getDecimalOdds() const
    {
      return mDecimalOdds;
    }

    /// Win probability in (0, 1]
    double getProbability() const
    {
      return mProbability;
    }

    /// true when the probability was derived from the odds rather than supplied
    bool isProbabilityEstimated() const
    {
      return mProbabilityEstimated;
    }

  private:
    Opportunity mOpportunity;
    double mDecimalOdds;
    double mProbability;
    bool mProbabilityEstimated;
  };

  /// Orders by descending probability; used with std::stable_sort so ties keep caller order.
  inline bool higherProbability(const ResolvedOpportunity& lhs, const ResolvedOpportunity& rhs)
  {
    return lhs.getProbability() > rhs.getProbability();
  }
}

#endif
