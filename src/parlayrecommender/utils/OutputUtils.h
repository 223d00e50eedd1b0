#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace parlayrecommender
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to log to both console and file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Generate a timestamp string for file naming and report headers
 *
 * Format is "MMM_DD_YYYY_HHMM", e.g. "Oct_19_2026_1430".
 */
std::string getCurrentTimestamp();

/**
 * @brief Default log file name for a run, e.g. "logs/parlay_recommendations_Oct_19_2026_1430.log"
 *
 * Creates the directory if it does not exist.
 */
std::string createLogFileName(const std::string& directory);

} // namespace utils
} // namespace parlayrecommender
