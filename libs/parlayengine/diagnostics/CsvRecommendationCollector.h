#pragma once
#include "IRecommendationObserver.h"
#include <fstream>
#include <string>

namespace parlayrec::diagnostics {

/**
 * @brief Appends one CSV row per diagnostic event.
 *
 * The header is written only when the file is new or empty, so repeated
 * runs can share one file.
 */
class CsvRecommendationCollector : public IRecommendationObserver {
public:
    explicit CsvRecommendationCollector(const std::string& filepath);
    ~CsvRecommendationCollector();

    void onDiagnosticEvent(const RecommendationDiagnosticRecord& record) override;

private:
    void writeHeaderIfNeeded();

    std::string m_filepath;
    std::ofstream m_ofs;
    bool m_headerWritten = false;
};

} // namespace parlayrec::diagnostics
