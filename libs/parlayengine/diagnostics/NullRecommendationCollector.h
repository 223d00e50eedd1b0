#pragma once
#include "IRecommendationObserver.h"

namespace parlayrec::diagnostics {

class NullRecommendationCollector : public IRecommendationObserver {
public:
    NullRecommendationCollector() = default;
    ~NullRecommendationCollector() override = default;

    void onDiagnosticEvent(const RecommendationDiagnosticRecord& /*record*/) override {}
};

} // namespace parlayrec::diagnostics
