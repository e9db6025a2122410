// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETIREMENT_STRATEGY_CONFIGURATION_H
#define __RETIREMENT_STRATEGY_CONFIGURATION_H 1

#include <cstdint>
#include <ostream>
#include "RetirementException.h"

namespace mkc_retirement
{
  /**
   * @brief Parameters of one fixed-withdrawal strategy.
   *
   * Every yearsPerRun years the held shares must be worth the inflated
   * initial capital plus the inflated living cost of the coming period.
   * The strategy is evaluated over numRuns such periods.
   */
  class StrategyConfiguration
  {
  public:
    static constexpr int64_t DefaultInitialCapital = 333333;
    static constexpr int DefaultNumRuns = 5;
    static constexpr int DefaultYearsPerRun = 10;
    static constexpr double DefaultInflationRate = 1.016;
    static constexpr int64_t DefaultAnnualCostOfLiving = 16666;

    StrategyConfiguration();

    /**
     * @param initialCapital Money used to buy shares on the start date, > 0.
     * @param numRuns Number of consecutive periods, >= 1.
     * @param yearsPerRun Length of one period in calendar years, >= 1.
     * @param inflationRate Annual inflation multiplier, >= 1.0 (1.016 is 1.6%).
     * @param annualCostOfLiving Money withdrawn per year, >= 0.
     * @throws StrategyConfigurationException if any value is out of range.
     */
    StrategyConfiguration(int64_t initialCapital,
			  int numRuns,
			  int yearsPerRun,
			  double inflationRate,
			  int64_t annualCostOfLiving);

    StrategyConfiguration(const StrategyConfiguration&) = default;
    StrategyConfiguration& operator=(const StrategyConfiguration&) = default;
    ~StrategyConfiguration() noexcept = default;

    int64_t getInitialCapital() const
    {
      return mInitialCapital;
    }

    int getNumRuns() const
    {
      return mNumRuns;
    }

    int getYearsPerRun() const
    {
      return mYearsPerRun;
    }

    double getInflationRate() const
    {
      return mInflationRate;
    }

    int64_t getAnnualCostOfLiving() const
    {
      return mAnnualCostOfLiving;
    }

  private:
    int64_t mInitialCapital;
    int mNumRuns;
    int mYearsPerRun;
    double mInflationRate;
    int64_t mAnnualCostOfLiving;
  };

  bool operator==(const StrategyConfiguration& lhs, const StrategyConfiguration& rhs);
  bool operator!=(const StrategyConfiguration& lhs, const StrategyConfiguration& rhs);

  std::ostream& operator<<(std::ostream& os, const StrategyConfiguration& config);
}

#endif
