/*==============================================================================
Options

The command line options are processed using Boost::Program Options. The
parsing is done in a class that can be instantiated on the command line
argument vector and the argument count. The same options can be given in a
configuration file with one "option = value" line per option, and options
given on the command line take precedence over the ones in the file.

The following options are currently supported:

-h [ --help ]                   = help message
--Config <file>                 = Configuration file with further options
-d [ --Directory ]              = Working directory. Default: current directory
-s [ --SpotPrice <CSV> ]        = Spot price forecast [€/kWh] (required)
-l [ --Load <CSV> ]             = Base load forecast [kW]
--BaseLoad <kW>                 = Constant base load if no load file (0.5)
-p [ --PV <CSV> ]               = Solar power forecast [kW]
--Irradiance <CSV>              = Plane of array irradiance [W/m²] used with
                                  the PV capacity if no PV file is given
--AirTemperature <CSV>          = Air temperature for the solar cells [°C]
--WindSpeed <m/s>               = Wind speed for the solar cells (1.0)
--PVCapacity <kW>               = DC capacity of the solar panels (5.0)
--Curtail                       = Allow curtailment of the solar power
-a [ --Ambient <CSV> ]          = Ambient temperature, adds a heat pump [°C]
--Horizon <steps>               = Optimisation horizon (96)
--StepDuration <h>              = Duration of a time step (0.25)
--Steps <n>                     = Rolling horizon iterations (1)
-o [ --Objective <name> ]       = cost, self_consumption or self_reliance
--Supplier <name>               = Tariff preset: Tibber, Zonneplan,
                                  "Frank Energie"
--ProcurementFee <€/kWh>        = Supplier fee on imported energy (0)
--SellBackCredit <€/kWh>        = Supplier credit on exported energy (0)
--EnergyTax <€/kWh>             = Tax on imported energy (0)
--VAT <fraction>                = Value added tax (0)
--NetMetering                   = Export credited at the import price
--BatteryCapacity <kWh>         = Home battery, 0 for none (13.5)
--EV                            = Adds an electric vehicle
--Departure <step>              = Daily departure of the vehicle (32)
--Arrival <step>                = Daily arrival of the vehicle (72)
--TripEnergy <kWh>              = Energy used by the daily trip (10)
--Solver <name>                 = OR-Tools backend (SCIP)
--TimeLimit <s>                 = Time limit for each solution
--Gap <fraction>                = Relative MIP gap
-r [ --Results <name> ]         = Result file name. Default: HEMS.csv
--LogLevel <level>              = trace, debug, info, warning, error (info)

The forecast files are CSV time series with the time in hours since the
start of the simulation and the value. The forecasts are resampled to the
time steps of the optimisation, where the prices are held constant between
samples and the physical quantities are interpolated.

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_OPTIONS
#define HEMS_OPTIONS

#include <filesystem>               // Portable filesystem
#include <optional>                 // Optional files and limits
#include <string>                   // Names
#include <chrono>                   // Time limit

#include <boost/log/trivial.hpp>    // Severity levels

#include "Typedefs.hpp"             // HEMS types
#include "EnergyManager.hpp"        // Objective modes
#include "ElectricVehicle.hpp"      // Trips
#include "Tariff.hpp"               // Tariff parameters

namespace HEMS {

class CommandLineOptions
{
private:

  // The working directory, the forecast files and the results

  std::filesystem::path WorkingDirectory, Results;

  std::optional< std::filesystem::path >
  SpotFile, LoadFile, PVFile, IrradianceFile, AirTemperatureFile, AmbientFile;

  // The scalar options are just stored as given

  double BaseLoadValue, WindSpeedValue, PVCapacityValue, BatteryCapacityValue,
         StepLength;
  bool   CurtailPV, WithEV;
  Dimension Steps, Iterations;

  EnergyManager::ObjectiveMode Mode;
  Tariff                       Contract;
  ElectricVehicle::Trip        DailyTrip;

  std::string SolverID;
  Linear::SolverOptions SolverSettings;

  boost::log::trivial::severity_level Level;

  // Files must exist when they are given

  std::filesystem::path CheckFile( const std::string & FileName,
                                   const std::string & Role ) const;

public:

  // The forecast files are returned as absolute paths

  inline std::filesystem::path SpotPriceFile( void ) const
  { return SpotFile.value(); }

  inline const std::optional< std::filesystem::path > & LoadForecast( void ) const
  { return LoadFile; }

  inline const std::optional< std::filesystem::path > & PVForecast( void ) const
  { return PVFile; }

  inline const std::optional< std::filesystem::path > &
  IrradianceForecast( void ) const
  { return IrradianceFile; }

  inline const std::optional< std::filesystem::path > &
  AirTemperatureForecast( void ) const
  { return AirTemperatureFile; }

  inline const std::optional< std::filesystem::path > &
  AmbientForecast( void ) const
  { return AmbientFile; }

  inline std::filesystem::path ResultFile( void ) const
  { return WorkingDirectory / Results; }

  // Household

  inline double BaseLoad( void ) const
  { return BaseLoadValue; }

  inline double WindSpeed( void ) const
  { return WindSpeedValue; }

  inline double PVCapacity( void ) const
  { return PVCapacityValue; }

  inline bool Curtailable( void ) const
  { return CurtailPV; }

  inline double BatteryCapacity( void ) const
  { return BatteryCapacityValue; }

  inline bool HasElectricVehicle( void ) const
  { return WithEV; }

  inline const ElectricVehicle::Trip & Commute( void ) const
  { return DailyTrip; }

  // Optimisation

  inline Dimension Horizon( void ) const
  { return Steps; }

  inline double StepDuration( void ) const
  { return StepLength; }

  inline Dimension RollingSteps( void ) const
  { return Iterations; }

  inline EnergyManager::ObjectiveMode Objective( void ) const
  { return Mode; }

  inline const Tariff & Prices( void ) const
  { return Contract; }

  inline const std::string & Solver( void ) const
  { return SolverID; }

  inline const Linear::SolverOptions & Settings( void ) const
  { return SolverSettings; }

  inline boost::log::trivial::severity_level LogLevel( void ) const
  { return Level; }

  // The constructor must have the argument count and the argument vector
  // and it will do all the command line parsing.

  CommandLineOptions( int argc, char **argv );
  CommandLineOptions( void ) = delete;
  CommandLineOptions( const CommandLineOptions & Other ) = delete;
};

}      // end name space HEMS
#endif // HEMS_OPTIONS
