#pragma once

#include <string>
#include <cstddef>
#include <optional>
#include <utility>
#include "RecommendationCategory.h"

namespace parlayrec::diagnostics
{
  enum class DiagnosticEventType
    {
      RecordRejected,         // opportunity dropped during probability resolution
      InsufficientPool,       // candidate window smaller than the leg count
      NoQualifyingGroupings,  // candidates existed but none met the thresholds
      CategoryCompleted,      // generator finished with at least one recommendation
      CategoryFailure,        // generator threw; the category was left empty
      DataSourceFailure       // the opportunity source threw; every category was left empty
    };

  inline std::string eventTypeToString(DiagnosticEventType type)
  {
    switch (type)
      {
      case DiagnosticEventType::RecordRejected:        return "RECORD_REJECTED";
      case DiagnosticEventType::InsufficientPool:      return "INSUFFICIENT_POOL";
      case DiagnosticEventType::NoQualifyingGroupings: return "NO_QUALIFYING_GROUPINGS";
      case DiagnosticEventType::CategoryCompleted:     return "CATEGORY_COMPLETED";
      case DiagnosticEventType::CategoryFailure:       return "CATEGORY_FAILURE";
      case DiagnosticEventType::DataSourceFailure:     return "DATA_SOURCE_FAILURE";
      }
    return "UNKNOWN";
  }

  class RecommendationDiagnosticRecord {
  public:
    RecommendationDiagnosticRecord(DiagnosticEventType eventType,
				   std::optional<RecommendationCategory> category,
				   std::string opportunityId,
				   std::string reason,
				   std::string message,
				   std::size_t count)
    : m_eventType(eventType),
      m_category(category),
      m_opportunityId(std::move(opportunityId)),
      m_reason(std::move(reason)),
      m_message(std::move(message)),
      m_count(count)
    {}

    RecommendationDiagnosticRecord() = delete;

    DiagnosticEventType getEventType() const { return m_eventType; }
    const std::optional<RecommendationCategory>& getCategory() const { return m_category; }

    /// Empty unless the event concerns a single record
    const std::string& getOpportunityId() const { return m_opportunityId; }

    /// Machine readable reason code, e.g. "ODDS_NOT_ABOVE_ONE"
    const std::string& getReason() const { return m_reason; }
    const std::string& getMessage() const { return m_message; }

    /// Event specific count: pool size, recommendations returned, records read
    std::size_t getCount() const { return m_count; }

  private:
    const DiagnosticEventType m_eventType;
    const std::optional<RecommendationCategory> m_category;
    const std::string m_opportunityId;
    const std::string m_reason;
    const std::string m_message;
    const std::size_t m_count;
  };

} // namespace parlayrec::diagnostics
