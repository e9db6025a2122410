// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PriceSeriesCsvReader.h"
#include <fstream>
#include <boost/algorithm/string.hpp>
#include "csv.h"

namespace mkc_retirement
{
  PriceColumn getPriceColumnFromString(const std::string& columnName)
  {
    const std::string name = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(columnName));

    if (name == "OPEN")
      return PriceColumn::Open;
    else if (name == "HIGH")
      return PriceColumn::High;
    else if (name == "LOW")
      return PriceColumn::Low;
    else if (name == "CLOSE")
      return PriceColumn::Close;
    else if (name == "ADJ CLOSE" || name == "ADJCLOSE")
      return PriceColumn::AdjClose;
    else
      throw PriceSeriesException("Unknown price column: " + columnName);
  }

  std::string getPriceColumnName(PriceColumn column)
  {
    switch (column)
      {
      case PriceColumn::Open:
	return "Open";
      case PriceColumn::High:
	return "High";
      case PriceColumn::Low:
	return "Low";
      case PriceColumn::Close:
	return "Close";
      case PriceColumn::AdjClose:
	return "Adj Close";
      }
    throw PriceSeriesException("getPriceColumnName: unknown price column");
  }

  PriceFileFormat getPriceFileFormatFromString(const std::string& formatName)
  {
    const std::string name = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(formatName));

    if (name == "YAHOO")
      return PriceFileFormat::YahooFinance;
    else if (name == "PAL")
      return PriceFileFormat::PriceActionLab;
    else
      throw PriceSeriesException("Unknown price file format: " + formatName);
  }

  PriceSeriesCsvReader::PriceSeriesCsvReader(const std::string& fileName, PriceColumn priceColumn)
    : mFileName(fileName),
      mPriceColumn(priceColumn),
      mPriceSeries(std::make_shared<PriceSeries>())
  {
    // ensure file exists (all readers inherit this check)
    std::ifstream fin(mFileName);
    if (!fin.is_open())
      throw PriceSeriesException("Cannot open file: " + mFileName);
  }

  void PriceSeriesCsvReader::addEntry(const date& entryDate, const std::string& priceString,
				      unsigned int lineNo)
  {
    double price = 0.0;
    std::size_t consumed = 0;
    try
      {
	price = std::stod(priceString, &consumed);
      }
    catch (const std::exception&)
      {
	reportError("price '" + priceString + "' is not a number", lineNo);
      }

    if (consumed != priceString.size())
      reportError("price '" + priceString + "' is not a number", lineNo);

    try
      {
	mPriceSeries->addEntry(PriceSample(entryDate, price));
      }
    catch (const PriceSeriesException& e)
      {
	reportError(e.what(), lineNo);
      }
  }

  void PriceSeriesCsvReader::reportError(const std::string& reason, unsigned int lineNo) const
  {
    throw PriceSeriesException(mFileName + ":" + std::to_string(lineNo) + ": " + reason);
  }

  YahooFinanceCsvReader::YahooFinanceCsvReader(const std::string& fileName, PriceColumn priceColumn)
    : PriceSeriesCsvReader(fileName, priceColumn)
  {}

  void YahooFinanceCsvReader::readFile()
  {
    std::string dateStamp, priceString;
    unsigned int numRows = 0;

    try
      {
	io::CSVReader<2, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> csvFile(getFileName());
	csvFile.read_header(io::ignore_extra_column, "Date", getPriceColumnName(getPriceColumn()));

	while (csvFile.read_row(dateStamp, priceString))
	  {
	    const unsigned int lineNo = csvFile.get_file_line();
	    date entryDate;
	    try
	      {
		entryDate = boost::gregorian::from_simple_string(dateStamp);
	      }
	    catch (const std::exception&)
	      {
		reportError("date '" + dateStamp + "' is not in YYYY-MM-DD format", lineNo);
	      }

	    addEntry(entryDate, priceString, lineNo);
	    ++numRows;
	  }
      }
    catch (const io::error::base& e)
      {
	throw PriceSeriesException("Error reading " + getFileName() + ": " + e.what());
      }

    if (numRows == 0)
      throw PriceSeriesException("No data rows found in file: " + getFileName());
  }

  PALFormatCsvReader::PALFormatCsvReader(const std::string& fileName, PriceColumn priceColumn)
    : PriceSeriesCsvReader(fileName, priceColumn)
  {
    if (priceColumn == PriceColumn::AdjClose)
      throw PriceSeriesException("PALFormatCsvReader: PAL files have no Adj Close column");
  }

  void PALFormatCsvReader::readFile()
  {
    std::string dateStamp;
    std::string openString, highString, lowString, closeString;
    unsigned int numRows = 0;

    try
      {
	io::CSVReader<5, io::trim_chars<' '>> csvFile(getFileName());
	csvFile.set_header("Date", "Open", "High", "Low", "Close");

	while (csvFile.read_row(dateStamp, openString, highString, lowString, closeString))
	  {
	    const unsigned int lineNo = csvFile.get_file_line();
	    date entryDate;
	    try
	      {
		entryDate = boost::gregorian::from_undelimited_string(dateStamp);
	      }
	    catch (const std::exception&)
	      {
		reportError("date '" + dateStamp + "' is not in YYYYMMDD format", lineNo);
	      }

	    switch (getPriceColumn())
	      {
	      case PriceColumn::Open:
		addEntry(entryDate, openString, lineNo);
		break;
	      case PriceColumn::High:
		addEntry(entryDate, highString, lineNo);
		break;
	      case PriceColumn::Low:
		addEntry(entryDate, lowString, lineNo);
		break;
	      case PriceColumn::Close:
		addEntry(entryDate, closeString, lineNo);
		break;
	      case PriceColumn::AdjClose:
		reportError("PAL files have no Adj Close column", lineNo);
	      }
	    ++numRows;
	  }
      }
    catch (const io::error::base& e)
      {
	throw PriceSeriesException("Error reading " + getFileName() + ": " + e.what());
      }

    if (numRows == 0)
      throw PriceSeriesException("No data rows found in file: " + getFileName());
  }

  std::shared_ptr<PriceSeriesCsvReader> createPriceSeriesReader(PriceFileFormat format,
								 const std::string& fileName,
								 PriceColumn priceColumn)
  {
    switch (format)
      {
      case PriceFileFormat::YahooFinance:
	return std::make_shared<YahooFinanceCsvReader>(fileName, priceColumn);
      case PriceFileFormat::PriceActionLab:
	return std::make_shared<PALFormatCsvReader>(fileName, priceColumn);
      }
    throw PriceSeriesException("createPriceSeriesReader: unknown file format");
  }
}
