// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETIREMENT_CSVREADER_H
#define __RETIREMENT_CSVREADER_H 1

#include <memory>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceSeries.h"
#include "RetirementException.h"

namespace mkc_retirement
{
  enum class PriceColumn
  {
    Open,
    High,
    Low,
    Close,
    AdjClose
  };

  /**
   * @brief Parse a column name as it appears in a Yahoo Finance header,
   * e.g. "High" or "Adj Close". Matching is case insensitive.
   * @throws PriceSeriesException for an unknown name.
   */
  PriceColumn getPriceColumnFromString(const std::string& columnName);
  std::string getPriceColumnName(PriceColumn column);

  enum class PriceFileFormat
  {
    YahooFinance,
    PriceActionLab
  };

  /**
   * @brief Parse "YAHOO" or "PAL" (case insensitive).
   * @throws PriceSeriesException for an unknown format.
   */
  PriceFileFormat getPriceFileFormatFromString(const std::string& formatName);

  class PriceSeriesCsvReader
  {
  public:
    PriceSeriesCsvReader(const std::string& fileName, PriceColumn priceColumn);

    PriceSeriesCsvReader(const PriceSeriesCsvReader&) = delete;
    PriceSeriesCsvReader& operator=(const PriceSeriesCsvReader&) = delete;

    virtual ~PriceSeriesCsvReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    PriceColumn getPriceColumn() const
    {
      return mPriceColumn;
    }

    std::shared_ptr<PriceSeries> getTimeSeries()
    {
      return mPriceSeries;
    }

    /**
     * @brief Read every row of the file into the price series.
     * @throws PriceSeriesException on a malformed row, or if the file holds no data rows.
     */
    virtual void readFile() = 0;

  protected:
    void addEntry(const date& entryDate, const std::string& priceString, unsigned int lineNo);

    [[noreturn]] void reportError(const std::string& reason, unsigned int lineNo) const;

  private:
    std::string mFileName;
    PriceColumn mPriceColumn;
    std::shared_ptr<PriceSeries> mPriceSeries;
  };

  // Reader for Yahoo Finance historical data downloads:
  //   Date,Open,High,Low,Close,Adj Close,Volume
  //   2000-01-03,1469.250000,1478.000000,...
  class YahooFinanceCsvReader : public PriceSeriesCsvReader
  {
  public:
    YahooFinanceCsvReader(const std::string& fileName, PriceColumn priceColumn = PriceColumn::High);

    ~YahooFinanceCsvReader()
    {}

    void readFile() override;
  };

  // Reader for Price Action Lab formatted files. No header, YYYYMMDD dates:
  //   20000103,1469.25,1478.00,1438.36,1455.22
  class PALFormatCsvReader : public PriceSeriesCsvReader
  {
  public:
    PALFormatCsvReader(const std::string& fileName, PriceColumn priceColumn = PriceColumn::High);

    ~PALFormatCsvReader()
    {}

    void readFile() override;
  };

  std::shared_ptr<PriceSeriesCsvReader> createPriceSeriesReader(PriceFileFormat format,
								 const std::string& fileName,
								 PriceColumn priceColumn);
}

#endif
