// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "StrategyConfiguration.h"
#include <cmath>
#include <string>

namespace mkc_retirement
{
  StrategyConfiguration::StrategyConfiguration()
    : StrategyConfiguration(DefaultInitialCapital,
			    DefaultNumRuns,
			    DefaultYearsPerRun,
			    DefaultInflationRate,
			    DefaultAnnualCostOfLiving)
  {}

  StrategyConfiguration::StrategyConfiguration(int64_t initialCapital,
					       int numRuns,
					       int yearsPerRun,
					       double inflationRate,
					       int64_t annualCostOfLiving)
    : mInitialCapital(initialCapital),
      mNumRuns(numRuns),
      mYearsPerRun(yearsPerRun),
      mInflationRate(inflationRate),
      mAnnualCostOfLiving(annualCostOfLiving)
  {
    if (initialCapital <= 0)
      throw StrategyConfigurationException("StrategyConfiguration: initial capital must be positive, got "
					   + std::to_string(initialCapital));

    if (numRuns < 1)
      throw StrategyConfigurationException("StrategyConfiguration: number of runs must be at least 1, got "
					   + std::to_string(numRuns));

    if (yearsPerRun < 1)
      throw StrategyConfigurationException("StrategyConfiguration: years per run must be at least 1, got "
					   + std::to_string(yearsPerRun));

    if (!std::isfinite(inflationRate) || inflationRate < 1.0)
      throw StrategyConfigurationException("StrategyConfiguration: inflation rate must be a multiplier of at least 1.0, got "
					   + std::to_string(inflationRate));

    if (annualCostOfLiving < 0)
      throw StrategyConfigurationException("StrategyConfiguration: annual cost of living cannot be negative, got "
					   + std::to_string(annualCostOfLiving));
  }

  bool operator==(const StrategyConfiguration& lhs, const StrategyConfiguration& rhs)
  {
    return ((lhs.getInitialCapital() == rhs.getInitialCapital()) &&
	    (lhs.getNumRuns() == rhs.getNumRuns()) &&
	    (lhs.getYearsPerRun() == rhs.getYearsPerRun()) &&
	    (lhs.getInflationRate() == rhs.getInflationRate()) &&
	    (lhs.getAnnualCostOfLiving() == rhs.getAnnualCostOfLiving()));
  }

  bool operator!=(const StrategyConfiguration& lhs, const StrategyConfiguration& rhs)
  {
    return !(lhs == rhs);
  }

  std::ostream& operator<<(std::ostream& os, const StrategyConfiguration& config)
  {
    os << "capital " << config.getInitialCapital()
       << ", runs " << config.getNumRuns()
       << ", years per run " << config.getYearsPerRun()
       << ", inflation rate " << config.getInflationRate()
       << ", cost per year " << config.getAnnualCostOfLiving();
    return os;
  }
}
