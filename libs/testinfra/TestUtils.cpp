#include "TestUtils.h"
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <boost/filesystem.hpp>

using namespace mkc_retirement;

boost::gregorian::date createDate(const std::string& dateString)
{
  return boost::gregorian::from_undelimited_string(dateString);
}

PriceSeries
createPriceSeries(std::initializer_list<std::pair<std::string, double>> samples)
{
  PriceSeries series("TEST");
  for (const auto& sample : samples)
    series.addEntry(PriceSample(createDate(sample.first), sample.second));

  return series;
}

PriceSeries
createSyntheticMonthlySeries(const boost::gregorian::date& firstDate, unsigned int numMonths)
{
  PriceSeries series("SYNTH");
  boost::gregorian::month_iterator it(firstDate);
  for (unsigned int m = 0; m < numMonths; ++m, ++it)
    {
      const double trend = 100.0 * std::pow(1.006, static_cast<double>(m));
      const double cycle = 1.0 + 0.35 * std::sin(static_cast<double>(m) / 9.0);
      series.addEntry(PriceSample(*it, trend * cycle));
    }

  return series;
}

std::string writeTemporaryFile(const std::string& contents)
{
  boost::filesystem::path path = boost::filesystem::temp_directory_path()
    / boost::filesystem::unique_path("retirement-%%%%-%%%%-%%%%.csv");

  std::ofstream out(path.string());
  if (!out.is_open())
    throw std::runtime_error("writeTemporaryFile: cannot create " + path.string());

  out << contents;
  return path.string();
}
