// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETIREMENT_DAY_LOCATOR_H
#define __RETIREMENT_DAY_LOCATOR_H 1

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <boost/optional.hpp>
#include "PriceSeries.h"

namespace mkc_retirement
{
  /**
   * @class DayLocator
   * @brief O(log n) lookup of the first sample on or after a date using std::lower_bound.
   * This class is stateless.
   */
  class DayLocator
  {
  public:
    /**
     * @brief Find the earliest sample whose date is on or after targetDate.
     * @param targetDate The date to search for.
     * @param series The price series, sorted ascending by date.
     * @param firstIndex Only samples at or after this index are considered.
     * @return The absolute index of the sample, or boost::none when every
     *         considered sample is dated before targetDate.
     */
    static boost::optional<std::size_t> locate(const date& targetDate,
					       const PriceSeries& series,
					       std::size_t firstIndex = 0)
    {
      if (firstIndex >= series.getNumEntries())
	return boost::none;

      auto first = series.beginSortedAccess() + static_cast<std::ptrdiff_t>(firstIndex);
      auto it = std::lower_bound(first, series.endSortedAccess(), targetDate,
				 [](const PriceSample& s, const date& d)
				 {
				   return s.getDate() < d;
				 });

      if (it == series.endSortedAccess())
	return boost::none;

      return static_cast<std::size_t>(std::distance(series.beginSortedAccess(), it));
    }
  };
}

#endif
