/*==============================================================================
HEMS simulator

The Household Energy Management System (HEMS) simulator finds the optimal
operation of a household with a base load, solar panels, a heat pump, a home
battery and an electric vehicle under a dynamic electricity contract where
the price follows the day-ahead spot market. The operation is optimised over
a horizon of forecasts for minimal cost, maximal self-consumption of the
solar energy, or maximal self-reliance, i.e. minimal import from the grid.

The problem is a mixed integer linear problem solved by the Google OR-Tools
[1] linear solver wrapper, and the simulation runs in a rolling horizon: The
problem is solved, the first time step is realised, and the problem is solved
again for the horizon starting at the next time step with updated forecasts.

The Command Options header documents the supported command line options, or a
summary can be obtained from using 'HEMS --help'. An example could be

HEMS --SpotPrice Prices.csv --PV Solar.csv --Ambient Temperature.csv
     --Supplier Zonneplan --EnergyTax 0.1108 --VAT 0.21 --EV
     --Directory ./Data --Steps 96 --Results Week.csv

where the forecast files are time series with the time in hours since the
start of the simulation:
<hours>, <value>
All the data files should be contained in the working directory (here ./Data),
and the realised operation will be written to the result file in the working
directory, here Week.csv.

References:
[1] Laurent Perron and Vincent Furnon: OR-Tools, Google,
    https://developers.google.com/optimization/

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#include "CommandOptions.hpp"    // The command line options
#include "Simulation.hpp"        // The rolling horizon simulation

#include <cstdlib>
#include <exception>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

int main( int argc, char **argv )
{
  try
  {
    // Parsing the command line options and setting the log level

    HEMS::CommandLineOptions Options( argc, argv );

    boost::log::core::get()->set_filter(
      boost::log::trivial::severity >= Options.LogLevel() );

    // Assembling the household and running the simulation

    HEMS::Simulation Household( Options );

    Household.Run();
  }
  catch ( const std::exception & Error )
  {
    BOOST_LOG_TRIVIAL( error ) << Error.what();
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
