// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include "PriceSeriesCsvReader.h"
#include "StrategyConfiguration.h"

namespace withdrawalbacktest
{
  using mkc_retirement::PriceColumn;
  using mkc_retirement::PriceFileFormat;
  using mkc_retirement::StrategyConfiguration;

  class BacktestConfigurationException : public std::runtime_error
  {
  public:
  BacktestConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~BacktestConfigurationException()
      {}
  };

  /**
   * @brief Everything one invocation of the backtester needs: where the
   * price history lives, how to read it, and the strategy to evaluate.
   */
  class BacktestConfiguration
  {
  public:
    static constexpr const char* DefaultDataPath = "./GSPC.csv";

    BacktestConfiguration();

    BacktestConfiguration(const std::string& dataFilePath,
			  PriceFileFormat fileFormat,
			  PriceColumn priceColumn,
			  const StrategyConfiguration& strategyConfiguration);

    BacktestConfiguration(const BacktestConfiguration&) = default;
    BacktestConfiguration& operator=(const BacktestConfiguration&) = default;
    ~BacktestConfiguration()
      {}

    const std::string& getDataFilePath() const
    {
      return mDataFilePath;
    }

    PriceFileFormat getFileFormat() const
    {
      return mFileFormat;
    }

    PriceColumn getPriceColumn() const
    {
      return mPriceColumn;
    }

    const StrategyConfiguration& getStrategyConfiguration() const
    {
      return mStrategyConfiguration;
    }

  private:
    std::string mDataFilePath;
    PriceFileFormat mFileFormat;
    PriceColumn mPriceColumn;
    StrategyConfiguration mStrategyConfiguration;
  };

  // Reads a one-row CSV configuration file. The header row is optional:
  //   DataPath,FileFormat,PriceColumn,InitialCapital,NumRuns,YearsPerRun,InflationRate,CostOfLiving
  //   ./GSPC.csv,YAHOO,High,333333,5,10,1.016,16666
  class BacktestConfigurationFileReader
  {
  public:
    BacktestConfigurationFileReader(const std::string& configurationFileName);
    ~BacktestConfigurationFileReader()
      {}

    std::shared_ptr<BacktestConfiguration> readConfigurationFile();

  private:
    std::string mConfigurationFileName;
  };
}
