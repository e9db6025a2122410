// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETIREMENT_WITHDRAWAL_BACKTESTER_H
#define __RETIREMENT_WITHDRAWAL_BACKTESTER_H 1

#include <cstddef>
#include <ostream>
#include <boost/optional.hpp>
#include "PeriodSimulator.h"
#include "PriceSeries.h"
#include "SimulationResult.h"
#include "StrategyConfiguration.h"

namespace mkc_retirement
{
  /**
   * @brief Tally of simulation outcomes over every starting date.
   */
  class AggregateResult
  {
  public:
    AggregateResult()
      : mSuccessCount(0),
	mFailedCount(0),
	mNotApplicableCount(0)
    {}

    void addOutcome(SimulationOutcome outcome);

    unsigned long getSuccessCount() const
    {
      return mSuccessCount;
    }

    unsigned long getFailedCount() const
    {
      return mFailedCount;
    }

    unsigned long getNotApplicableCount() const
    {
      return mNotApplicableCount;
    }

    unsigned long getTotalCount() const
    {
      return mSuccessCount + mFailedCount + mNotApplicableCount;
    }

    /**
     * @brief successCount / (successCount + failedCount).
     * @return boost::none when no simulation reached a verdict.
     */
    boost::optional<double> getSuccessRate() const;

  private:
    unsigned long mSuccessCount;
    unsigned long mFailedCount;
    unsigned long mNotApplicableCount;
  };

  bool operator==(const AggregateResult& lhs, const AggregateResult& rhs);
  bool operator!=(const AggregateResult& lhs, const AggregateResult& rhs);

  /**
   * @brief Backtests one StrategyConfiguration from every date of a price series.
   *
   * Each sample in turn is the purchase day of an independent simulation that
   * may only look forward from that sample.
   */
  class WithdrawalBacktester
  {
  public:
    explicit WithdrawalBacktester(const StrategyConfiguration& config);

    WithdrawalBacktester(const WithdrawalBacktester&) = default;
    WithdrawalBacktester& operator=(const WithdrawalBacktester&) = default;
    ~WithdrawalBacktester() noexcept = default;

    const StrategyConfiguration& getConfiguration() const
    {
      return mSimulator.getConfiguration();
    }

    /**
     * @param series Price history, sorted ascending by date.
     * @param traceStream If non-null, every simulation writes its trace here.
     * @throws PriceSeriesException if the series is empty.
     */
    AggregateResult run(const PriceSeries& series, std::ostream* traceStream = nullptr) const;

  private:
    PeriodSimulator mSimulator;
  };
}

#endif
