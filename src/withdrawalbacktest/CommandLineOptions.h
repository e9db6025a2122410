#pragma once

#include <string>
#include <boost/program_options.hpp>
#include "BacktestConfiguration.h"

namespace withdrawalbacktest
{
  namespace po = boost::program_options;

  /**
   * @brief Describe every option accepted by the withdrawalbacktest executable.
   *
   * Short forms:
   * -f file, -c capital, -r runs, -y years per run, -i inflation, -l living cost, -v verbose.
   */
  po::options_description createOptionsDescription();

  /**
   * @brief Build the run configuration from parsed options.
   *
   * With --config the configuration file provides the starting values;
   * otherwise the option defaults do. Options given explicitly on the
   * command line override either.
   *
   * @throws BacktestConfigurationException if a value is invalid.
   */
  BacktestConfiguration createBacktestConfiguration(const po::variables_map& vm);
}
