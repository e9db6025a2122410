#ifndef __RETIREMENT_TEST_UTILS_H
#define __RETIREMENT_TEST_UTILS_H 1

#include <initializer_list>
#include <string>
#include <utility>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceSeries.h"

// YYYYMMDD
boost::gregorian::date createDate(const std::string& dateString);

// Build a series from (YYYYMMDD, price) pairs
mkc_retirement::PriceSeries
createPriceSeries(std::initializer_list<std::pair<std::string, double>> samples);

// Monthly samples starting at firstDate whose price trends up with a
// repeating drawdown, so some start dates succeed and others fail.
mkc_retirement::PriceSeries
createSyntheticMonthlySeries(const boost::gregorian::date& firstDate, unsigned int numMonths);

// Write contents to a uniquely named file in the temporary directory and
// return its path
std::string writeTemporaryFile(const std::string& contents);

#endif
