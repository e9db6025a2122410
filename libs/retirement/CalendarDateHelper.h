// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//
#ifndef __RETIREMENT_CALENDAR_DATE_HELPER_H
#define __RETIREMENT_CALENDAR_DATE_HELPER_H 1

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace mkc_retirement
{
  typedef boost::gregorian::date RetirementDate;

  // Largest year boost::gregorian::date can represent
  constexpr int kMaxCalendarYear = 9999;

  /**
   * @brief   Add whole calendar years to a date, keeping month and day.
   *
   * February 29 in a target year that is not a leap year normalizes to
   * March 1. This differs from adding boost::gregorian::years, which snaps
   * to the end of the month.
   *
   * @returns pos_infin if the result lies past the last representable year.
   */
  inline RetirementDate add_calendar_years(const RetirementDate& aDate, int numYears)
  {
    if (aDate.is_special())
      return aDate;

    const int year = static_cast<int>(aDate.year());
    if (numYears > kMaxCalendarYear - year)
      return RetirementDate(boost::date_time::pos_infin);

    const int targetYear = year + numYears;

    if (aDate.month() == boost::gregorian::Feb && aDate.day() == 29 &&
	!boost::gregorian::gregorian_calendar::is_leap_year(static_cast<unsigned short>(targetYear)))
      return RetirementDate(targetYear, boost::gregorian::Mar, 1);

    return RetirementDate(targetYear, aDate.month(), aDate.day());
  }

  // YYYY-MM-DD
  inline std::string to_iso_date_string(const RetirementDate& aDate)
  {
    return boost::gregorian::to_iso_extended_string(aDate);
  }
}

#endif
