// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETIREMENT_PERIOD_SIMULATOR_H
#define __RETIREMENT_PERIOD_SIMULATOR_H 1

#include <cstddef>
#include <ostream>
#include "PriceSeries.h"
#include "SimulationResult.h"
#include "StrategyConfiguration.h"

namespace mkc_retirement
{
  /**
   * @brief Simulates a retiree who buys shares on one starting date and
   * lives off them for numRuns periods of yearsPerRun years.
   *
   * For every period the held shares must reach the inflated initial capital
   * plus the inflated living cost of the period. The first day in the period
   * that reaches this target is the liquidation day: enough shares are sold
   * to pay the living cost and the next period begins. A period that never
   * reaches the target fails the simulation. A period that ends after the
   * last sample makes the simulation not applicable.
   *
   * Share counts are always truncated toward zero.
   */
  class PeriodSimulator
  {
  public:
    explicit PeriodSimulator(const StrategyConfiguration& config);

    PeriodSimulator(const PeriodSimulator&) = default;
    PeriodSimulator& operator=(const PeriodSimulator&) = default;
    ~PeriodSimulator() noexcept = default;

    const StrategyConfiguration& getConfiguration() const
    {
      return mConfiguration;
    }

    /**
     * @brief Run one simulation starting at series[startIndex].
     * @param series Price history. Samples before startIndex are never used.
     * @param startIndex Index of the purchase day.
     * @param traceStream If non-null, receives a verbose trace of the simulation.
     * @throws PriceSeriesOffsetOutOfRangeException if startIndex is past the end.
     */
    SimulationRunResult simulate(const PriceSeries& series,
				 std::size_t startIndex,
				 std::ostream* traceStream = nullptr) const;

  private:
    StrategyConfiguration mConfiguration;
  };
}

#endif
