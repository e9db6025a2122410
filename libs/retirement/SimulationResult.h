// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETIREMENT_SIMULATION_RESULT_H
#define __RETIREMENT_SIMULATION_RESULT_H 1

#include <cstddef>
#include <cstdint>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace mkc_retirement
{
  using boost::gregorian::date;

  enum class SimulationOutcome
  {
    Success,
    Failed,
    NotApplicable
  };

  /**
   * @brief A share sale that funded the living cost of one run.
   */
  class LiquidationEvent
  {
  public:
    LiquidationEvent(int runNumber,
		     std::size_t sampleIndex,
		     const date& saleDate,
		     double price,
		     double targetCapital,
		     double costOfLiving,
		     int64_t sharesSold,
		     int64_t sharesRemaining)
      : mRunNumber(runNumber),
	mSampleIndex(sampleIndex),
	mSaleDate(saleDate),
	mPrice(price),
	mTargetCapital(targetCapital),
	mCostOfLiving(costOfLiving),
	mSharesSold(sharesSold),
	mSharesRemaining(sharesRemaining)
    {}

    int getRunNumber() const
    {
      return mRunNumber;
    }

    std::size_t getSampleIndex() const
    {
      return mSampleIndex;
    }

    const date& getSaleDate() const
    {
      return mSaleDate;
    }

    double getPrice() const
    {
      return mPrice;
    }

    double getTargetCapital() const
    {
      return mTargetCapital;
    }

    double getCostOfLiving() const
    {
      return mCostOfLiving;
    }

    int64_t getSharesSold() const
    {
      return mSharesSold;
    }

    int64_t getSharesRemaining() const
    {
      return mSharesRemaining;
    }

  private:
    int mRunNumber;
    std::size_t mSampleIndex;
    date mSaleDate;
    double mPrice;
    double mTargetCapital;
    double mCostOfLiving;
    int64_t mSharesSold;
    int64_t mSharesRemaining;
  };

  /**
   * @brief Outcome of simulating the strategy from one starting index,
   * together with the share history that led to it.
   */
  class SimulationRunResult
  {
  public:
    SimulationRunResult(const date& startDate, int64_t initialShares)
      : mOutcome(SimulationOutcome::Success),
	mStartDate(startDate),
	mInitialShares(initialShares),
	mLiquidationEvents()
    {}

    SimulationOutcome getOutcome() const
    {
      return mOutcome;
    }

    void setOutcome(SimulationOutcome outcome)
    {
      mOutcome = outcome;
    }

    const date& getStartDate() const
    {
      return mStartDate;
    }

    int64_t getInitialShares() const
    {
      return mInitialShares;
    }

    int64_t getRemainingShares() const
    {
      if (mLiquidationEvents.empty())
	return mInitialShares;

      return mLiquidationEvents.back().getSharesRemaining();
    }

    // Each satisfied run produces exactly one liquidation event
    std::size_t getNumRunsSatisfied() const
    {
      return mLiquidationEvents.size();
    }

    void addLiquidationEvent(const LiquidationEvent& event)
    {
      mLiquidationEvents.push_back(event);
    }

    const std::vector<LiquidationEvent>& getLiquidationEvents() const
    {
      return mLiquidationEvents;
    }

  private:
    SimulationOutcome mOutcome;
    date mStartDate;
    int64_t mInitialShares;
    std::vector<LiquidationEvent> mLiquidationEvents;
  };
}

#endif
