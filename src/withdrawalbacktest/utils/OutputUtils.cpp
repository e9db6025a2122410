#include "OutputUtils.h"
#include <cstdio>
#include <iomanip>
#include <sstream>
#include "CalendarDateHelper.h"

using namespace mkc_retirement;

namespace withdrawalbacktest
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }
    
    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string formatSuccessRate(const AggregateResult& result)
{
    const auto rate = result.getSuccessRate();
    if (!rate)
    {
        return "N/A";
    }

    std::ostringstream os;
    os << std::fixed << std::setprecision(6) << *rate;
    return os.str();
}

void writeRunHeader(std::ostream& os,
                    const BacktestConfiguration& config,
                    const PriceSeries& series)
{
    os << "Data file: " << config.getDataFilePath()
       << " (" << getPriceColumnName(config.getPriceColumn()) << " prices)" << std::endl;
    os << "Samples: " << series.getNumEntries();
    if (!series.isEmpty())
    {
        os << ", " << to_iso_date_string(series.getFirstDate())
           << " to " << to_iso_date_string(series.getLastDate());
    }
    os << std::endl;
    os << "Strategy: " << config.getStrategyConfiguration() << std::endl;
}

void writeBacktestSummary(std::ostream& os, const AggregateResult& result)
{
    os << "success " << result.getSuccessCount()
       << ", failed: " << result.getFailedCount()
       << ", N/A: " << result.getNotApplicableCount()
       << ", successful rate " << formatSuccessRate(result) << std::endl;
}

} // namespace utils
} // namespace withdrawalbacktest
