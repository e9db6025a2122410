// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETIREMENT_EXCEPTION_H
#define __RETIREMENT_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_retirement
{
  class RetirementException : public std::runtime_error
  {
  public:
    RetirementException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~RetirementException() = default;
  };

  // Empty or malformed price data. Raised before any simulation runs.
  class PriceSeriesException : public RetirementException
  {
  public:
    explicit PriceSeriesException(const std::string& msg)
      : RetirementException(msg) {}
  };

  class PriceSeriesOffsetOutOfRangeException : public PriceSeriesException
  {
  public:
    explicit PriceSeriesOffsetOutOfRangeException(const std::string& msg)
      : PriceSeriesException(msg) {}
  };

  class StrategyConfigurationException : public RetirementException
  {
  public:
    explicit StrategyConfigurationException(const std::string& msg)
      : RetirementException(msg) {}
  };

} // namespace mkc_retirement

#endif // __RETIREMENT_EXCEPTION_H
