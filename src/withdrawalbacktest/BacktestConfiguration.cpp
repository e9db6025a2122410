// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BacktestConfiguration.h"
#include <boost/filesystem.hpp>
#include "RetirementException.h"
#include "csv.h"

namespace withdrawalbacktest
{
  namespace
  {
    template <class T, class Converter>
    T parseField(const std::string& fieldName, const std::string& value, Converter convert)
    {
      std::size_t consumed = 0;
      T result;
      try
	{
	  result = convert(value, &consumed);
	}
      catch (const std::exception&)
	{
	  throw BacktestConfigurationException("BacktestConfigurationFileReader: " + fieldName
					       + " value '" + value + "' is not a number");
	}

      if (consumed != value.size())
	throw BacktestConfigurationException("BacktestConfigurationFileReader: " + fieldName
					     + " value '" + value + "' is not a number");
      return result;
    }

    // A header row names at least the data path and capital columns
    bool startsWithColumnNames(const std::string& configurationFileName)
    {
      io::LineReader lines(configurationFileName);
      const char* line = lines.next_line();
      if (line == nullptr)
	return false;

      const std::string columns(line);
      return columns.find("DataPath") != std::string::npos
	&& columns.find("InitialCapital") != std::string::npos;
    }
  }

  BacktestConfiguration::BacktestConfiguration()
    : BacktestConfiguration(DefaultDataPath,
			    PriceFileFormat::YahooFinance,
			    PriceColumn::High,
			    StrategyConfiguration())
  {}

  BacktestConfiguration::BacktestConfiguration(const std::string& dataFilePath,
					       PriceFileFormat fileFormat,
					       PriceColumn priceColumn,
					       const StrategyConfiguration& strategyConfiguration)
    : mDataFilePath(dataFilePath),
      mFileFormat(fileFormat),
      mPriceColumn(priceColumn),
      mStrategyConfiguration(strategyConfiguration)
  {
    if (dataFilePath.empty())
      throw BacktestConfigurationException("BacktestConfiguration: data file path cannot be empty");
  }

  BacktestConfigurationFileReader::BacktestConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<BacktestConfiguration> BacktestConfigurationFileReader::readConfigurationFile()
  {
    if (!boost::filesystem::exists(boost::filesystem::path(mConfigurationFileName)))
      throw BacktestConfigurationException("Configuration file " + mConfigurationFileName + " does not exist");

    std::string dataPath, fileFormatStr, priceColumnStr;
    std::string capitalStr, runsStr, yearsStr, inflationStr, costStr;

    try
      {
	const bool hasHeader = startsWithColumnNames(mConfigurationFileName);
	io::CSVReader<8, io::trim_chars<' '>> csvConfigFile(mConfigurationFileName);

	if (hasHeader)
	  csvConfigFile.read_header(io::ignore_no_column, "DataPath", "FileFormat", "PriceColumn",
				    "InitialCapital", "NumRuns", "YearsPerRun", "InflationRate",
				    "CostOfLiving");
	else
	  csvConfigFile.set_header("DataPath", "FileFormat", "PriceColumn",
				   "InitialCapital", "NumRuns", "YearsPerRun", "InflationRate",
				   "CostOfLiving");

	if (!csvConfigFile.read_row(dataPath, fileFormatStr, priceColumnStr,
				    capitalStr, runsStr, yearsStr, inflationStr, costStr))
	  throw BacktestConfigurationException("Configuration file " + mConfigurationFileName
					       + " has no configuration row");
      }
    catch (const io::error::base& e)
      {
	throw BacktestConfigurationException("Error reading configuration file "
					     + mConfigurationFileName + ": " + e.what());
      }

    const int64_t initialCapital =
      parseField<int64_t>("InitialCapital", capitalStr,
			  [](const std::string& s, std::size_t* pos) { return static_cast<int64_t>(std::stoll(s, pos)); });
    const int numRuns =
      parseField<int>("NumRuns", runsStr,
		      [](const std::string& s, std::size_t* pos) { return std::stoi(s, pos); });
    const int yearsPerRun =
      parseField<int>("YearsPerRun", yearsStr,
		      [](const std::string& s, std::size_t* pos) { return std::stoi(s, pos); });
    const double inflationRate =
      parseField<double>("InflationRate", inflationStr,
			 [](const std::string& s, std::size_t* pos) { return std::stod(s, pos); });
    const int64_t costOfLiving =
      parseField<int64_t>("CostOfLiving", costStr,
			  [](const std::string& s, std::size_t* pos) { return static_cast<int64_t>(std::stoll(s, pos)); });

    try
      {
	return std::make_shared<BacktestConfiguration>(dataPath,
						       mkc_retirement::getPriceFileFormatFromString(fileFormatStr),
						       mkc_retirement::getPriceColumnFromString(priceColumnStr),
						       StrategyConfiguration(initialCapital, numRuns, yearsPerRun,
									     inflationRate, costOfLiving));
      }
    catch (const mkc_retirement::RetirementException& e)
      {
	throw BacktestConfigurationException("Configuration file " + mConfigurationFileName + ": " + e.what());
      }
  }
}
