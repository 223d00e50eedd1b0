#pragma once
#include <cstdint>
#include <string>
#include <sstream>

namespace parlayrec
{
  /**
   * @brief Bitmask enum for the reasons a candidate grouping was not accepted.
   *
   * A grouping can fail both thresholds at once, so reasons combine with
   * bitwise OR.
   */
  enum class GroupingReject : std::uint32_t
    {
      None                 = 0u,
      BelowMinOdds         = 1u << 0,  // combined multiplier under the category minimum
      BelowMinProbability  = 1u << 1,  // combined probability under the category minimum
      DuplicateLabel       = 1u << 2,  // two legs describe the same participant
      DuplicateLabelSet    = 1u << 3,  // same participants as a higher ranked grouping
      // bits 4..31 reserved
    };

  inline GroupingReject operator|(GroupingReject a, GroupingReject b) noexcept
  {
    return static_cast<GroupingReject>(
				       static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
  }

  inline GroupingReject operator&(GroupingReject a, GroupingReject b) noexcept
  {
    return static_cast<GroupingReject>(
				       static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(b));
  }

  inline GroupingReject& operator|=(GroupingReject& a, GroupingReject b) noexcept
  {
    a = (a | b);
    return a;
  }

  inline bool hasRejection(GroupingReject mask, GroupingReject reason) noexcept
  {
    return static_cast<std::uint32_t>(mask & reason) != 0u;
  }

  inline std::string rejectionMaskToString(GroupingReject mask)
  {
    if (mask == GroupingReject::None) {
      return "";
    }

    std::ostringstream oss;
    bool first = true;

    auto append = [&](GroupingReject flag, const char* name) {
      if (hasRejection(mask, flag)) {
	if (!first) oss << ";";
	oss << name;
	first = false;
      }
    };

    append(GroupingReject::BelowMinOdds,        "BELOW_MIN_ODDS");
    append(GroupingReject::BelowMinProbability, "BELOW_MIN_PROBABILITY");
    append(GroupingReject::DuplicateLabel,      "DUPLICATE_LABEL");
    append(GroupingReject::DuplicateLabelSet,   "DUPLICATE_LABEL_SET");

    return oss.str();
  }
} // namespace parlayrec
