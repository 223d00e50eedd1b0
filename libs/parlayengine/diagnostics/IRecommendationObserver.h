#pragma once
#include "RecommendationDiagnosticRecord.h"

namespace parlayrec::diagnostics {

class IRecommendationObserver {
public:
    virtual ~IRecommendationObserver() = default;
    virtual void onDiagnosticEvent(const RecommendationDiagnosticRecord& record) = 0;
};

} // namespace parlayrec::diagnostics
