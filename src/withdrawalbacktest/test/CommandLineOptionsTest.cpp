#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdio>
#include <string>
#include <vector>
#include "CommandLineOptions.h"
#include "TestUtils.h"

using namespace withdrawalbacktest;
using mkc_retirement::PriceColumn;
using mkc_retirement::PriceFileFormat;
using mkc_retirement::StrategyConfiguration;
using Catch::Approx;

namespace
{
  po::variables_map parseArguments(const std::vector<std::string>& arguments)
  {
    std::vector<const char*> argv;
    argv.push_back("withdrawalbacktest");
    for (const auto& argument : arguments)
      argv.push_back(argument.c_str());

    po::variables_map vm;
    po::store(po::parse_command_line(static_cast<int>(argv.size()), argv.data(),
				     createOptionsDescription()), vm);
    po::notify(vm);
    return vm;
  }
}

TEST_CASE("No options gives the default configuration", "[CommandLineOptions]") {
    po::variables_map vm = parseArguments({});
    BacktestConfiguration config = createBacktestConfiguration(vm);

    REQUIRE(config.getDataFilePath() == "./GSPC.csv");
    REQUIRE(config.getFileFormat() == PriceFileFormat::YahooFinance);
    REQUIRE(config.getPriceColumn() == PriceColumn::High);
    REQUIRE(config.getStrategyConfiguration() == StrategyConfiguration(333333, 5, 10, 1.016, 16666));
    REQUIRE(vm.count("verbose") == 0);
}

TEST_CASE("Short options set the strategy", "[CommandLineOptions]") {
    po::variables_map vm = parseArguments({"-f", "SPY.csv", "-c", "1000000", "-r", "3",
					   "-y", "15", "-i", "1.03", "-l", "40000", "-v"});
    BacktestConfiguration config = createBacktestConfiguration(vm);

    REQUIRE(config.getDataFilePath() == "SPY.csv");
    const StrategyConfiguration& strategy = config.getStrategyConfiguration();
    REQUIRE(strategy.getInitialCapital() == 1000000);
    REQUIRE(strategy.getNumRuns() == 3);
    REQUIRE(strategy.getYearsPerRun() == 15);
    REQUIRE(strategy.getInflationRate() == Approx(1.03));
    REQUIRE(strategy.getAnnualCostOfLiving() == 40000);
    REQUIRE(vm.count("verbose") == 1);
}

TEST_CASE("Format and price column options", "[CommandLineOptions]") {
    po::variables_map vm = parseArguments({"--format", "pal", "--price-column", "close"});
    BacktestConfiguration config = createBacktestConfiguration(vm);

    REQUIRE(config.getFileFormat() == PriceFileFormat::PriceActionLab);
    REQUIRE(config.getPriceColumn() == PriceColumn::Close);
}

TEST_CASE("Explicit options override the configuration file", "[CommandLineOptions]") {
    const std::string path = writeTemporaryFile(
        "DataPath,FileFormat,PriceColumn,InitialCapital,NumRuns,YearsPerRun,InflationRate,CostOfLiving\n"
        "/data/QQQ.csv,YAHOO,Open,250000,4,6,1.025,12000\n");

    SECTION("file values are used when no option is given") {
        BacktestConfiguration config = createBacktestConfiguration(parseArguments({"--config", path}));

        REQUIRE(config.getDataFilePath() == "/data/QQQ.csv");
        REQUIRE(config.getPriceColumn() == PriceColumn::Open);
        REQUIRE(config.getStrategyConfiguration() == StrategyConfiguration(250000, 4, 6, 1.025, 12000));
    }
    SECTION("explicit options win") {
        BacktestConfiguration config =
          createBacktestConfiguration(parseArguments({"--config", path, "-r", "2", "-p", "Low"}));

        REQUIRE(config.getDataFilePath() == "/data/QQQ.csv");
        REQUIRE(config.getPriceColumn() == PriceColumn::Low);
        REQUIRE(config.getStrategyConfiguration() == StrategyConfiguration(250000, 2, 6, 1.025, 12000));
    }

    std::remove(path.c_str());
}

TEST_CASE("Invalid option values are configuration errors", "[CommandLineOptions]") {
    SECTION("zero years") {
        REQUIRE_THROWS_AS(createBacktestConfiguration(parseArguments({"-y", "0"})),
                          BacktestConfigurationException);
    }
    SECTION("negative living cost") {
        REQUIRE_THROWS_AS(createBacktestConfiguration(parseArguments({"--living-cost=-5"})),
                          BacktestConfigurationException);
    }
    SECTION("unknown price column") {
        REQUIRE_THROWS_AS(createBacktestConfiguration(parseArguments({"-p", "Volume"})),
                          BacktestConfigurationException);
    }
    SECTION("missing configuration file") {
        REQUIRE_THROWS_AS(createBacktestConfiguration(parseArguments({"--config", "no_such_config.csv"})),
                          BacktestConfigurationException);
    }
    SECTION("non numeric capital") {
        REQUIRE_THROWS_AS(parseArguments({"-c", "plenty"}), po::error);
    }
}
