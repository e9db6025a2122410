#pragma once

#include <streambuf>
#include <ostream>
#include <string>
#include "BacktestConfiguration.h"
#include "PriceSeries.h"
#include "WithdrawalBacktester.h"

namespace withdrawalbacktest
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 * 
 * This class allows writing to two different stream buffers simultaneously,
 * useful for logging to both console and file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    /**
     * @brief Construct a TeeBuf with two target stream buffers
     * @param sb1 First stream buffer to write to
     * @param sb2 Second stream buffer to write to
     */
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
 * @brief Format a success rate the way the summary line prints it
 * @return Six decimal places, or "N/A" when no simulation reached a verdict
 */
std::string formatSuccessRate(const mkc_retirement::AggregateResult& result);

/**
 * @brief Write the data file, sample range and strategy parameters of a run
 */
void writeRunHeader(std::ostream& os,
                    const BacktestConfiguration& config,
                    const mkc_retirement::PriceSeries& series);

/**
 * @brief Write the one line summary:
 * "success S, failed: F, N/A: N, successful rate R"
 */
void writeBacktestSummary(std::ostream& os, const mkc_retirement::AggregateResult& result);

} // namespace utils
} // namespace withdrawalbacktest
