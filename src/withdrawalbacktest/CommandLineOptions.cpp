#include "CommandLineOptions.h"
#include <cstdint>
#include "RetirementException.h"

namespace withdrawalbacktest
{
  namespace
  {
    bool isExplicit(const po::variables_map& vm, const std::string& name)
    {
      return vm.count(name) && !vm[name].defaulted();
    }
  }

  po::options_description createOptionsDescription()
  {
    po::options_description desc("Options");
    desc.add_options()
      ("help,h", "Show help message")
      ("config", po::value<std::string>(), "CSV configuration file; explicit options override its values")
      ("file,f", po::value<std::string>()->default_value(BacktestConfiguration::DefaultDataPath),
       "Input CSV path")
      ("format", po::value<std::string>()->default_value("YAHOO"),
       "Input file format (YAHOO, PAL)")
      ("price-column,p", po::value<std::string>()->default_value("High"),
       "Price column used from the input file (Open, High, Low, Close, Adj Close)")
      ("capital,c", po::value<int64_t>()->default_value(StrategyConfiguration::DefaultInitialCapital),
       "Initial capital")
      ("runs,r", po::value<int>()->default_value(StrategyConfiguration::DefaultNumRuns),
       "How many runs to test")
      ("years,y", po::value<int>()->default_value(StrategyConfiguration::DefaultYearsPerRun),
       "How many years in one run")
      ("inflation,i", po::value<double>()->default_value(StrategyConfiguration::DefaultInflationRate),
       "Inflation rate (annual multiplier)")
      ("living-cost,l", po::value<int64_t>()->default_value(StrategyConfiguration::DefaultAnnualCostOfLiving),
       "Cost of living per year")
      ("log-file", po::value<std::string>(), "Also write all output to this file")
      ("verbose,v", "Show verbose progress");
    return desc;
  }

  BacktestConfiguration createBacktestConfiguration(const po::variables_map& vm)
  {
    BacktestConfiguration base;
    if (vm.count("config"))
      {
	BacktestConfigurationFileReader reader(vm["config"].as<std::string>());
	base = *reader.readConfigurationFile();
      }

    const StrategyConfiguration& strategy = base.getStrategyConfiguration();

    std::string dataPath = base.getDataFilePath();
    PriceFileFormat fileFormat = base.getFileFormat();
    PriceColumn priceColumn = base.getPriceColumn();
    int64_t capital = strategy.getInitialCapital();
    int runs = strategy.getNumRuns();
    int years = strategy.getYearsPerRun();
    double inflation = strategy.getInflationRate();
    int64_t livingCost = strategy.getAnnualCostOfLiving();

    if (isExplicit(vm, "file"))
      dataPath = vm["file"].as<std::string>();
    if (isExplicit(vm, "capital"))
      capital = vm["capital"].as<int64_t>();
    if (isExplicit(vm, "runs"))
      runs = vm["runs"].as<int>();
    if (isExplicit(vm, "years"))
      years = vm["years"].as<int>();
    if (isExplicit(vm, "inflation"))
      inflation = vm["inflation"].as<double>();
    if (isExplicit(vm, "living-cost"))
      livingCost = vm["living-cost"].as<int64_t>();

    try
      {
	if (isExplicit(vm, "format"))
	  fileFormat = mkc_retirement::getPriceFileFormatFromString(vm["format"].as<std::string>());
	if (isExplicit(vm, "price-column"))
	  priceColumn = mkc_retirement::getPriceColumnFromString(vm["price-column"].as<std::string>());

	return BacktestConfiguration(dataPath, fileFormat, priceColumn,
				     StrategyConfiguration(capital, runs, years, inflation, livingCost));
      }
    catch (const mkc_retirement::RetirementException& e)
      {
	throw BacktestConfigurationException(e.what());
      }
  }
}
