// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETIREMENT_PRICE_SERIES_H
#define __RETIREMENT_PRICE_SERIES_H 1

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <type_traits>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "RetirementException.h"

namespace mkc_retirement
{
  using boost::gregorian::date;

  /**
   * @brief One day of price history: a calendar date and a single price.
   *
   * @throws PriceSeriesException if the date is not a real calendar date or
   *         the price is not a positive, finite number.
   */
  class PriceSample
  {
  public:
    PriceSample(const date& sampleDate, double price);

    PriceSample(const PriceSample&) = default;
    PriceSample& operator=(const PriceSample&) = default;
    ~PriceSample() noexcept = default;

    const date& getDate() const
    {
      return mDate;
    }

    double getPrice() const
    {
      return mPrice;
    }

  private:
    date mDate;
    double mPrice;
  };

  bool operator==(const PriceSample& lhs, const PriceSample& rhs);
  bool operator!=(const PriceSample& lhs, const PriceSample& rhs);

  /**
   * @brief Daily price history, kept sorted ascending by date.
   *
   * Unlike an OHLC series, duplicate dates are accepted. A sample whose date
   * already exists is placed after the existing ones, so lookups by date
   * always resolve to the sample that was added first.
   */
  class PriceSeries
  {
  public:
    using ConstSortedIterator = std::vector<PriceSample>::const_iterator;

    PriceSeries();
    explicit PriceSeries(const std::string& symbol);

    /**
     * @brief Builds a series from a range of samples. The samples are
     * stable-sorted by date.
     */
    template<
      class InputIt,
      class = typename std::enable_if<
	std::is_same<typename std::iterator_traits<InputIt>::value_type,
		     PriceSample>::value>::type>
    PriceSeries(const std::string& symbol, InputIt first, InputIt last)
      : mSymbol(symbol),
	mData(first, last)
    {
      std::stable_sort(mData.begin(), mData.end(),
		       [](const PriceSample& a, const PriceSample& b)
		       {
			 return a.getDate() < b.getDate();
		       });
    }

    PriceSeries(const PriceSeries&) = default;
    PriceSeries& operator=(const PriceSeries&) = default;
    PriceSeries(PriceSeries&&) noexcept = default;
    PriceSeries& operator=(PriceSeries&&) noexcept = default;
    ~PriceSeries() noexcept = default;

    void addEntry(const PriceSample& sample);

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    std::size_t getNumEntries() const
    {
      return mData.size();
    }

    bool isEmpty() const
    {
      return mData.empty();
    }

    /**
     * @throws PriceSeriesOffsetOutOfRangeException if index is past the end.
     */
    const PriceSample& getEntry(std::size_t index) const;

    /**
     * @throws PriceSeriesException if the series is empty.
     */
    const date& getFirstDate() const;
    const date& getLastDate() const;

    ConstSortedIterator beginSortedAccess() const
    {
      return mData.begin();
    }

    ConstSortedIterator endSortedAccess() const
    {
      return mData.end();
    }

  private:
    std::string mSymbol;
    std::vector<PriceSample> mData;
  };

} // namespace mkc_retirement

#endif // __RETIREMENT_PRICE_SERIES_H
