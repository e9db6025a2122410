// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PeriodSimulator.h"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include "CalendarDateHelper.h"
#include "DayLocator.h"
#include "RetirementException.h"

namespace mkc_retirement
{
  namespace
  {
    std::string formatPrice(double price)
    {
      std::ostringstream os;
      os << std::fixed << std::setprecision(6) << price;
      return os.str();
    }

    // Money amounts are reported as whole units, truncated toward zero
    std::string formatAmount(double amount)
    {
      std::ostringstream os;
      os << std::fixed << std::setprecision(0) << std::trunc(amount);
      return os.str();
    }

    // 2^63, the first value past the int64_t range
    constexpr double kShareCountLimit = 9223372036854775808.0;

    int64_t truncateShares(double shares, const PriceSample& sample)
    {
      if (!(shares >= 0.0 && shares < kShareCountLimit))
	throw PriceSeriesException("PeriodSimulator: share count out of range at "
				   + to_iso_date_string(sample.getDate())
				   + " for price " + formatPrice(sample.getPrice()));

      return static_cast<int64_t>(shares);
    }
  }

  PeriodSimulator::PeriodSimulator(const StrategyConfiguration& config)
    : mConfiguration(config)
  {}

  SimulationRunResult PeriodSimulator::simulate(const PriceSeries& series,
						std::size_t startIndex,
						std::ostream* traceStream) const
  {
    const PriceSample& purchase = series.getEntry(startIndex);
    const int64_t initialCapital = mConfiguration.getInitialCapital();
    const int yearsPerRun = mConfiguration.getYearsPerRun();

    int64_t heldShares = truncateShares(static_cast<double>(initialCapital) / purchase.getPrice(), purchase);
    SimulationRunResult result(purchase.getDate(), heldShares);

    if (traceStream)
      *traceStream << "initial: capital " << initialCapital << ", it can buy "
		   << heldShares << " shares" << std::endl << std::endl;

    date periodStart = purchase.getDate();
    date periodEnd = purchase.getDate();

    for (int run = 0; run < mConfiguration.getNumRuns(); ++run)
      {
	periodStart = periodEnd;
	periodEnd = add_calendar_years(periodStart, yearsPerRun);

	auto startIdx = DayLocator::locate(periodStart, series, startIndex);
	auto endIdx = DayLocator::locate(periodEnd, series, startIndex);
	if (!startIdx || !endIdx)
	  {
	    if (traceStream)
	      *traceStream << "no more available date to test" << std::endl;

	    result.setOutcome(SimulationOutcome::NotApplicable);
	    return result;
	  }

	const double inflationFactor = std::pow(mConfiguration.getInflationRate(),
						static_cast<double>(run + 1) * static_cast<double>(yearsPerRun));
	const double inflatedCapital = static_cast<double>(initialCapital) * inflationFactor;
	const double costOfLiving = static_cast<double>(mConfiguration.getAnnualCostOfLiving())
	  * static_cast<double>(yearsPerRun) * inflationFactor;
	const double targetCapital = inflatedCapital + costOfLiving;

	if (traceStream)
	  *traceStream << to_iso_date_string(series.getEntry(*startIdx).getDate()) << " to "
		       << to_iso_date_string(series.getEntry(*endIdx).getDate())
		       << ", target capital " << formatAmount(targetCapital)
		       << ", prepared cost of living " << formatAmount(costOfLiving)
		       << std::endl;

	bool satisfied = false;
	for (std::size_t currIndex = *startIdx; currIndex < *endIdx; ++currIndex)
	  {
	    const PriceSample& sample = series.getEntry(currIndex);
	    const double price = sample.getPrice();

	    if (static_cast<double>(heldShares) * price >= targetCapital)
	      {
		satisfied = true;

		const int64_t soldShares = truncateShares(costOfLiving / price, sample);
		heldShares -= soldShares;

		result.addLiquidationEvent(LiquidationEvent(run, currIndex, sample.getDate(), price,
							    targetCapital, costOfLiving,
							    soldShares, heldShares));

		if (traceStream)
		  {
		    *traceStream << to_iso_date_string(sample.getDate())
				 << " sell " << soldShares << " shares in " << formatPrice(price)
				 << ", earn " << formatAmount(static_cast<double>(soldShares) * price)
				 << ", remained shares " << heldShares << std::endl;
		    *traceStream << "new capital "
				 << formatAmount(static_cast<double>(heldShares) * price)
				 << std::endl << std::endl;
		  }
		break;
	      }
	  }

	if (!satisfied)
	  {
	    if (traceStream)
	      *traceStream << "not satisfied" << std::endl;

	    result.setOutcome(SimulationOutcome::Failed);
	    return result;
	  }
      }

    result.setOutcome(SimulationOutcome::Success);
    return result;
  }
}
