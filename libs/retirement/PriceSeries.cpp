// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PriceSeries.h"
#include <cmath>

namespace mkc_retirement
{
  PriceSample::PriceSample(const date& sampleDate, double price)
    : mDate(sampleDate),
      mPrice(price)
  {
    if (sampleDate.is_special())
      throw PriceSeriesException("PriceSample: date " + boost::gregorian::to_simple_string(sampleDate)
				 + " is not a calendar date");

    if (!std::isfinite(price) || price <= 0.0)
      throw PriceSeriesException("PriceSample: price " + std::to_string(price) + " on "
				 + boost::gregorian::to_iso_extended_string(sampleDate)
				 + " must be a positive number");
  }

  bool operator==(const PriceSample& lhs, const PriceSample& rhs)
  {
    return ((lhs.getDate() == rhs.getDate()) &&
	    (lhs.getPrice() == rhs.getPrice()));
  }

  bool operator!=(const PriceSample& lhs, const PriceSample& rhs)
  {
    return !(lhs == rhs);
  }

  PriceSeries::PriceSeries()
    : PriceSeries(std::string())
  {}

  PriceSeries::PriceSeries(const std::string& symbol)
    : mSymbol(symbol),
      mData()
  {}

  void PriceSeries::addEntry(const PriceSample& sample)
  {
    // upper_bound keeps samples with equal dates in insertion order
    auto it = std::upper_bound(mData.begin(), mData.end(), sample.getDate(),
			       [](const date& d, const PriceSample& s)
			       {
				 return d < s.getDate();
			       });
    mData.insert(it, sample);
  }

  const PriceSample& PriceSeries::getEntry(std::size_t index) const
  {
    if (index >= mData.size())
      throw PriceSeriesOffsetOutOfRangeException("PriceSeries::getEntry: index " + std::to_string(index)
						 + " outside bounds of series with "
						 + std::to_string(mData.size()) + " entries");
    return mData[index];
  }

  const date& PriceSeries::getFirstDate() const
  {
    if (mData.empty())
      throw PriceSeriesException("PriceSeries::getFirstDate: no entries in price series");

    return mData.front().getDate();
  }

  const date& PriceSeries::getLastDate() const
  {
    if (mData.empty())
      throw PriceSeriesException("PriceSeries::getLastDate: no entries in price series");

    return mData.back().getDate();
  }
}
