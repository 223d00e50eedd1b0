#include "CsvRecommendationCollector.h"
#include <stdexcept>
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>

namespace parlayrec::diagnostics
{
  namespace
  {
    // Fields are free text; quote them so commas in messages keep the column count
    std::string quoted(const std::string& field)
    {
      std::string out("\"");
      for (char c : field)
	{
	  if (c == '"')
	    out += "\"\"";
	  else
	    out += c;
	}
      out += "\"";
      return out;
    }
  }

  CsvRecommendationCollector::CsvRecommendationCollector(const std::string& filepath)
    : m_filepath(filepath)
  {
    boost::system::error_code ec;
    if (boost::filesystem::exists(m_filepath, ec) && boost::filesystem::file_size(m_filepath, ec) > 0 && !ec) {
      m_headerWritten = true;
    }

    m_ofs.open(m_filepath, std::ios::out | std::ios::app);
    if (!m_ofs.is_open()) {
      throw std::runtime_error("Failed to open diagnostic file: " + m_filepath);
    }

    writeHeaderIfNeeded();
  }

  CsvRecommendationCollector::~CsvRecommendationCollector() {
    if (m_ofs.is_open()) m_ofs.close();
  }

  void CsvRecommendationCollector::writeHeaderIfNeeded()
  {
    if (m_headerWritten) return;

    m_ofs << "Event,Category,OpportunityID,Reason,Count,Message\n";

    m_ofs.flush();
    m_headerWritten = true;
  }

  void CsvRecommendationCollector::onDiagnosticEvent(const RecommendationDiagnosticRecord& r)
  {
    if (!m_ofs.is_open()) return;

    m_ofs << eventTypeToString(r.getEventType()) << ","
          << (r.getCategory() ? categoryName(*r.getCategory()) : std::string()) << ","
          << quoted(r.getOpportunityId()) << ","
          << r.getReason() << ","
          << r.getCount() << ","
          << quoted(r.getMessage()) << "\n";

    m_ofs.flush();
  }
}
