/*==============================================================================
Simulation

The simulation runs the energy manager in a rolling horizon over a number of
time steps. The household is assembled from the command line options: a base
load, optionally solar panels, a heat pump, a home battery and an electric
vehicle. At each iteration the forecasts are resampled for the horizon
starting at the current time step, the problem is solved, the first time step
of the solution is recorded as the realised operation of the household, and
the storage devices are advanced to the second time step before the next
iteration.

The electric vehicle repeats the same commute every day, and the trips are
shifted to the current time step for each iteration. A trip that has already
departed at the start of the horizon keeps the vehicle away until it arrives,
but its energy has already been taken from the vehicle's battery.

The realised operation is written to a CSV result file with one line per
time step and the following columns:

step, time [h], spot [€/kWh], import [kW], export [kW], load [kW], pv [kW],
heat pump [kW], battery [kW], battery energy [kWh], ev [kW],
ev energy [kWh], cost [€]

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_SIMULATION
#define HEMS_SIMULATION

#include <memory>                  // Smart pointers
#include <optional>                // Optional components
#include <vector>                  // Trips

#include "Typedefs.hpp"            // HEMS types
#include "CommandOptions.hpp"      // The options
#include "Resampling.hpp"          // Forecasts
#include "Load.hpp"                // Base load
#include "Solar.hpp"               // Solar panels
#include "PVWatts.hpp"             // Solar power from irradiance
#include "HeatPump.hpp"            // Heat pump
#include "Battery.hpp"             // Home battery
#include "ElectricVehicle.hpp"     // Electric vehicle
#include "EnergyManager.hpp"       // The optimizer

namespace HEMS
{

class Simulation
{
private:

  const CommandLineOptions & Options;

  // The forecasts are kept as resamplers so that they can be evaluated for
  // any horizon start.

  std::unique_ptr< Resampler > SpotPrice, BaseLoad, SolarPower, Irradiance,
                               AirTemperature, Ambient;

  std::optional< PVWatts > PVModel;

  // The household components. The components that are not present are
  // empty pointers.

  std::shared_ptr< FixedLoad >       House;
  std::shared_ptr< Solar >           PV;
  std::shared_ptr< HeatPump >        HP;
  std::shared_ptr< Battery >         HomeBattery;
  std::shared_ptr< ElectricVehicle > EV;

  std::unique_ptr< EnergyManager > Manager;

  // Utility functions to compute the forecasts and trips for an iteration

  static std::unique_ptr< Resampler >
  ReadForecast( const std::optional< std::filesystem::path > & File,
                Resampler::Method Interpolation );

  TimeSeries Forecast( Resampler & Samples, Dimension Iteration ) const;
  TimeSeries SolarForecast( Dimension Iteration ) const;
  TimeSeries LoadForecast( Dimension Iteration ) const;
  Tariff     PriceForecast( Dimension Iteration ) const;

  std::vector< ElectricVehicle::Trip > Trips( Dimension Iteration ) const;

  // Setting the forecasts of all components for an iteration

  void Update( Dimension Iteration );

public:

  // Running the simulation writes the result file and returns the total
  // cost of the realised operation.

  double Run( void );

  Simulation( const CommandLineOptions & TheOptions );

  Simulation( void ) = delete;
  Simulation( const Simulation & Other ) = delete;
};

}      // End name space HEMS
#endif // HEMS_SIMULATION
