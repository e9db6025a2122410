#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdio>
#include <string>
#include "PriceSeriesCsvReader.h"
#include "TestUtils.h"

using namespace mkc_retirement;
using boost::gregorian::date;
using Catch::Approx;

namespace
{
  const std::string kYahooFile =
    "Date,Open,High,Low,Close,Adj Close,Volume\n"
    "2000-01-04,1455.219971,1455.219971,1397.430054,1399.420044,1399.420044,1009000000\n"
    "2000-01-03,1469.250000,1478.000000,1438.359985,1455.219971,1455.219971,931800000\n"
    "2000-01-05,1399.420044,1413.270020,1377.680054,1402.109985,1402.109985,1085500000\n";

  // Removes the file when the test leaves scope
  class TemporaryFile
  {
  public:
    explicit TemporaryFile(const std::string& contents)
      : mPath(writeTemporaryFile(contents))
    {}

    ~TemporaryFile()
    {
      std::remove(mPath.c_str());
    }

    const std::string& path() const
    {
      return mPath;
    }

  private:
    std::string mPath;
  };
}

TEST_CASE("YahooFinanceCsvReader reads the High column by default", "[csv][Yahoo]") {
    TemporaryFile file(kYahooFile);
    YahooFinanceCsvReader reader(file.path());

    REQUIRE(reader.getFileName() == file.path());
    REQUIRE(reader.getPriceColumn() == PriceColumn::High);
    REQUIRE_NOTHROW(reader.readFile());

    auto series = reader.getTimeSeries();
    REQUIRE(series->getNumEntries() == 3);
    REQUIRE(series->getFirstDate() == date(2000, 1, 3));
    REQUIRE(series->getLastDate() == date(2000, 1, 5));
    REQUIRE(series->getEntry(0).getPrice() == Approx(1478.0));
    REQUIRE(series->getEntry(1).getPrice() == Approx(1455.219971));
    REQUIRE(series->getEntry(2).getPrice() == Approx(1413.270020));
}

TEST_CASE("YahooFinanceCsvReader reads a selected column", "[csv][Yahoo]") {
    TemporaryFile file(kYahooFile);

    SECTION("Close") {
        YahooFinanceCsvReader reader(file.path(), PriceColumn::Close);
        reader.readFile();
        REQUIRE(reader.getTimeSeries()->getEntry(0).getPrice() == Approx(1455.219971));
    }
    SECTION("Adj Close") {
        YahooFinanceCsvReader reader(file.path(), PriceColumn::AdjClose);
        reader.readFile();
        REQUIRE(reader.getTimeSeries()->getEntry(2).getPrice() == Approx(1402.109985));
    }
}

TEST_CASE("YahooFinanceCsvReader rejects malformed input", "[csv][Yahoo]") {
    SECTION("missing file") {
        REQUIRE_THROWS_AS(YahooFinanceCsvReader("no_such_file_for_reader_test.csv"), PriceSeriesException);
    }
    SECTION("null price row") {
        TemporaryFile file("Date,Open,High,Low,Close,Adj Close,Volume\n"
                           "2000-01-03,1469.25,1478.00,1438.36,1455.22,1455.22,931800000\n"
                           "2000-01-04,null,null,null,null,null,null\n");
        YahooFinanceCsvReader reader(file.path());
        REQUIRE_THROWS_AS(reader.readFile(), PriceSeriesException);
    }
    SECTION("bad date") {
        TemporaryFile file("Date,Open,High,Low,Close,Adj Close,Volume\n"
                           "01/03/2000,1469.25,1478.00,1438.36,1455.22,1455.22,931800000\n");
        YahooFinanceCsvReader reader(file.path());
        REQUIRE_THROWS_AS(reader.readFile(), PriceSeriesException);
    }
    SECTION("zero price") {
        TemporaryFile file("Date,Open,High,Low,Close,Adj Close,Volume\n"
                           "2000-01-03,0,0,0,0,0,0\n");
        YahooFinanceCsvReader reader(file.path());
        REQUIRE_THROWS_AS(reader.readFile(), PriceSeriesException);
    }
    SECTION("missing price column") {
        TemporaryFile file("Date,Open,Close\n"
                           "2000-01-03,1469.25,1455.22\n");
        YahooFinanceCsvReader reader(file.path());
        REQUIRE_THROWS_AS(reader.readFile(), PriceSeriesException);
    }
    SECTION("header only") {
        TemporaryFile file("Date,Open,High,Low,Close,Adj Close,Volume\n");
        YahooFinanceCsvReader reader(file.path());
        REQUIRE_THROWS_AS(reader.readFile(), PriceSeriesException);
    }
}

TEST_CASE("PALFormatCsvReader reads undelimited dates without a header", "[csv][PAL]") {
    TemporaryFile file("20000103,1469.25,1478.00,1438.36,1455.22\n"
                       "20000104,1455.22,1455.22,1397.43,1399.42\n");

    SECTION("High") {
        PALFormatCsvReader reader(file.path());
        reader.readFile();
        auto series = reader.getTimeSeries();
        REQUIRE(series->getNumEntries() == 2);
        REQUIRE(series->getFirstDate() == date(2000, 1, 3));
        REQUIRE(series->getEntry(0).getPrice() == Approx(1478.00));
    }
    SECTION("Low") {
        PALFormatCsvReader reader(file.path(), PriceColumn::Low);
        reader.readFile();
        REQUIRE(reader.getTimeSeries()->getEntry(1).getPrice() == Approx(1397.43));
    }
    SECTION("Adj Close is not available") {
        REQUIRE_THROWS_AS(PALFormatCsvReader(file.path(), PriceColumn::AdjClose), PriceSeriesException);
    }
}

TEST_CASE("Price column and file format names", "[csv]") {
    REQUIRE(getPriceColumnFromString("High") == PriceColumn::High);
    REQUIRE(getPriceColumnFromString("open") == PriceColumn::Open);
    REQUIRE(getPriceColumnFromString("LOW") == PriceColumn::Low);
    REQUIRE(getPriceColumnFromString("Close") == PriceColumn::Close);
    REQUIRE(getPriceColumnFromString("Adj Close") == PriceColumn::AdjClose);
    REQUIRE_THROWS_AS(getPriceColumnFromString("Volume"), PriceSeriesException);

    REQUIRE(getPriceColumnName(PriceColumn::AdjClose) == "Adj Close");
    REQUIRE(getPriceColumnName(getPriceColumnFromString("close")) == "Close");

    REQUIRE(getPriceFileFormatFromString("yahoo") == PriceFileFormat::YahooFinance);
    REQUIRE(getPriceFileFormatFromString("PAL") == PriceFileFormat::PriceActionLab);
    REQUIRE_THROWS_AS(getPriceFileFormatFromString("CSI"), PriceSeriesException);
}

TEST_CASE("createPriceSeriesReader picks the reader for the format", "[csv]") {
    TemporaryFile file(kYahooFile);
    auto reader = createPriceSeriesReader(PriceFileFormat::YahooFinance, file.path(), PriceColumn::Open);
    REQUIRE(reader->getPriceColumn() == PriceColumn::Open);
    reader->readFile();
    REQUIRE(reader->getTimeSeries()->getEntry(0).getPrice() == Approx(1469.25));
}
