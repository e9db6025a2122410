// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "WithdrawalBacktester.h"
#include "CalendarDateHelper.h"
#include "RetirementException.h"

namespace mkc_retirement
{
  void AggregateResult::addOutcome(SimulationOutcome outcome)
  {
    switch (outcome)
      {
      case SimulationOutcome::Success:
	++mSuccessCount;
	break;
      case SimulationOutcome::Failed:
	++mFailedCount;
	break;
      case SimulationOutcome::NotApplicable:
	++mNotApplicableCount;
	break;
      }
  }

  boost::optional<double> AggregateResult::getSuccessRate() const
  {
    const unsigned long decided = mSuccessCount + mFailedCount;
    if (decided == 0)
      return boost::none;

    return static_cast<double>(mSuccessCount) / static_cast<double>(decided);
  }

  bool operator==(const AggregateResult& lhs, const AggregateResult& rhs)
  {
    return ((lhs.getSuccessCount() == rhs.getSuccessCount()) &&
	    (lhs.getFailedCount() == rhs.getFailedCount()) &&
	    (lhs.getNotApplicableCount() == rhs.getNotApplicableCount()));
  }

  bool operator!=(const AggregateResult& lhs, const AggregateResult& rhs)
  {
    return !(lhs == rhs);
  }

  WithdrawalBacktester::WithdrawalBacktester(const StrategyConfiguration& config)
    : mSimulator(config)
  {}

  AggregateResult WithdrawalBacktester::run(const PriceSeries& series, std::ostream* traceStream) const
  {
    if (series.isEmpty())
      throw PriceSeriesException("WithdrawalBacktester::run: no input data");

    AggregateResult result;
    for (std::size_t i = 0; i < series.getNumEntries(); ++i)
      {
	if (traceStream)
	  *traceStream << "=== start date " << to_iso_date_string(series.getEntry(i).getDate())
		       << " ===" << std::endl;

	result.addOutcome(mSimulator.simulate(series, i, traceStream).getOutcome());
      }

    return result;
  }
}
