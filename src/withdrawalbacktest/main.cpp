#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include "BacktestConfiguration.h"
#include "CommandLineOptions.h"
#include "PriceSeriesCsvReader.h"
#include "RetirementException.h"
#include "WithdrawalBacktester.h"
#include "utils/OutputUtils.h"

using namespace mkc_retirement;
using namespace withdrawalbacktest;
namespace fs = boost::filesystem;

void printUsage(const po::options_description& desc)
{
    std::cout << "Fixed withdrawal retirement backtester\n\n";
    std::cout << "Buys shares with the initial capital on every date of the price history and\n";
    std::cout << "checks whether they can fund the cost of living for every run.\n\n";
    std::cout << "Usage: withdrawalbacktest [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Default strategy against S&P 500 highs\n";
    std::cout << "  withdrawalbacktest -f GSPC.csv\n\n";
    std::cout << "  # Three 15 year runs with 2% inflation, tracing every simulation\n";
    std::cout << "  withdrawalbacktest -f GSPC.csv -r 3 -y 15 -i 1.02 -v --log-file trace.txt\n\n";
    std::cout << "  # Parameters from a configuration file, overriding the cost of living\n";
    std::cout << "  withdrawalbacktest --config retirement.csv -l 20000\n";
}

int runBacktest(const BacktestConfiguration& config, bool verbose, std::ostream& out)
{
    auto reader = createPriceSeriesReader(config.getFileFormat(),
                                          config.getDataFilePath(),
                                          config.getPriceColumn());
    reader->readFile();
    std::shared_ptr<PriceSeries> series = reader->getTimeSeries();

    utils::writeRunHeader(out, config, *series);
    out << std::endl;

    WithdrawalBacktester backtester(config.getStrategyConfiguration());
    AggregateResult result = backtester.run(*series, verbose ? &out : nullptr);

    utils::writeBacktestSummary(out, result);
    return 0;
}

int main(int argc, char* argv[])
{
    try {
        po::options_description desc = createOptionsDescription();

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        const bool verbose = vm.count("verbose") > 0;
        BacktestConfiguration config = createBacktestConfiguration(vm);

        fs::path dataFilePath(config.getDataFilePath());
        if (!fs::exists(dataFilePath) || !fs::is_regular_file(dataFilePath)) {
            std::cerr << "Error: historic data file " << dataFilePath.string() << " does not exist" << std::endl;
            return 1;
        }

        if (vm.count("log-file")) {
            const std::string logPath = vm["log-file"].as<std::string>();
            std::ofstream logFile(logPath);
            if (!logFile.is_open()) {
                std::cerr << "Error: cannot open log file " << logPath << std::endl;
                return 1;
            }

            utils::TeeStream out(std::cout, logFile);
            return runBacktest(config, verbose, out);
        }

        return runBacktest(config, verbose, std::cout);
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
