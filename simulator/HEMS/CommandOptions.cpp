/*==============================================================================
Options

This implements the options class, i.e. the constructor implementing the
parsing of the command line options and the configuration file.

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#include <string>                    // Standard strings
#include <iostream>                  // Printing help
#include <sstream>                   // Formatted error messages
#include <stdexcept>                 // Standard exceptions
#include <cmath>                     // Rounding the time limit
#include <boost/program_options.hpp> // Option parser

#include "CommandOptions.hpp"

namespace cmd = boost::program_options;

// A given file name is taken relative to the working directory, and it is
// an error if the file does not exist.

std::filesystem::path
HEMS::CommandLineOptions::CheckFile( const std::string & FileName,
                                     const std::string & Role ) const
{
  std::filesystem::path TheFile = WorkingDirectory / FileName;

  if ( !std::filesystem::exists( TheFile ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The " << Role << " file " << TheFile
                 << " does not exist";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  return TheFile;
}

HEMS::CommandLineOptions::CommandLineOptions( int argc, char **argv )
: WorkingDirectory( std::filesystem::current_path() ), Results( "HEMS.csv" ),
  SpotFile(), LoadFile(), PVFile(), IrradianceFile(), AirTemperatureFile(),
  AmbientFile(), BaseLoadValue( 0.5 ), WindSpeedValue( 1.0 ),
  PVCapacityValue( 5.0 ), BatteryCapacityValue( 13.5 ),
  StepLength( DefaultStepDuration ), CurtailPV( false ), WithEV( false ),
  Steps( 96 ), Iterations( 1 ), Mode( EnergyManager::ObjectiveMode::Cost ),
  Contract(), DailyTrip( ElectricVehicle::DefaultCommute().front() ),
  SolverID( "SCIP" ), SolverSettings(), Level( boost::log::trivial::info )
{
	// The options class must have an object describing the options and the
	// help messages generated

	cmd::options_description Description("Allowed options");

	// The values are stored in a map from option names to values

	cmd::variables_map Values;

  // Defining and describing the options in case help is requested

	Description.add_options()
		( "help,h", "Produce this help message" )
		( "Config", cmd::value< std::string >(),
								"Configuration file with further options" )
		( "Directory,d", cmd::value< std::string >(),
								"Working directory" )
		( "SpotPrice,s", cmd::value< std::string >()->required(),
								"Spot price forecast file [EUR/kWh]" )
		( "Load,l", cmd::value< std::string >(),
								"Base load forecast file [kW]" )
		( "BaseLoad", cmd::value< double >(),
								"Constant base load if no load file is given [kW]" )
		( "PV,p", cmd::value< std::string >(),
								"Solar power forecast file [kW]" )
		( "Irradiance", cmd::value< std::string >(),
								"Plane of array irradiance forecast file [W/m2]" )
		( "AirTemperature", cmd::value< std::string >(),
								"Air temperature forecast for the solar cells [C]" )
		( "WindSpeed", cmd::value< double >(),
								"Wind speed for the solar cells [m/s]" )
		( "PVCapacity", cmd::value< double >(),
								"DC capacity of the solar panels [kW]" )
		( "Curtail", cmd::bool_switch(),
								"Allow curtailment of the solar power" )
		( "Ambient,a", cmd::value< std::string >(),
								"Ambient temperature forecast file, adds a heat pump [C]" )
		( "Horizon", cmd::value< Dimension >(),
								"Number of time steps in the optimisation horizon" )
		( "StepDuration", cmd::value< double >(),
								"Duration of a time step [h]" )
		( "Steps", cmd::value< Dimension >(),
								"Number of rolling horizon iterations" )
		( "Objective,o", cmd::value< std::string >(),
								"cost, self_consumption or self_reliance" )
		( "Supplier", cmd::value< std::string >(),
								"Supplier tariff preset" )
		( "ProcurementFee", cmd::value< double >(),
								"Supplier fee on imported energy [EUR/kWh]" )
		( "SellBackCredit", cmd::value< double >(),
								"Supplier credit on exported energy [EUR/kWh]" )
		( "EnergyTax", cmd::value< double >(),
								"Tax on imported energy [EUR/kWh]" )
		( "VAT", cmd::value< double >(),
								"Value added tax fraction" )
		( "NetMetering", cmd::bool_switch(),
								"Export is credited at the import price" )
		( "BatteryCapacity", cmd::value< double >(),
								"Home battery capacity, zero for no battery [kWh]" )
		( "EV", cmd::bool_switch(),
								"Adds an electric vehicle" )
		( "Departure", cmd::value< long >(),
								"Daily departure time step of the vehicle" )
		( "Arrival", cmd::value< long >(),
								"Daily arrival time step of the vehicle" )
		( "TripEnergy", cmd::value< double >(),
								"Energy used by the daily trip [kWh]" )
		( "Solver", cmd::value< std::string >(),
								"OR-Tools solver backend" )
		( "TimeLimit", cmd::value< double >(),
								"Time limit for each solution [s]" )
		( "Gap", cmd::value< double >(),
								"Relative MIP gap" )
		( "Results,r", cmd::value< std::string >(),
								"Result file name" )
		( "LogLevel", cmd::value< std::string >(),
								"trace, debug, info, warning or error" );

	// Parsing the command line. The configuration file is parsed after the
	// command line, and since stored values are never overwritten the
	// command line takes precedence.

	cmd::store( cmd::parse_command_line( argc, argv, Description), Values );

	// Printing the description of the options if the help option is present

  if ( Values.count("help") > 0 )
  {
		std::cout << Description << std::endl;
		exit( EXIT_SUCCESS );
	}

  if ( Values.count("Config") > 0 )
  {
    std::string ConfigFile = Values["Config"].as< std::string >();

    if ( !std::filesystem::exists( ConfigFile ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The configuration file " << ConfigFile
                   << " does not exist";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    cmd::store( cmd::parse_config_file< char >( ConfigFile.c_str(),
                                                Description ), Values );
  }

  // Throwing an exception if the required options are not given

	cmd::notify( Values );

  // Setting the working directory if it was given. The files are relative
  // to the working directory.

  if ( Values.count("Directory") > 0 )
  {
    WorkingDirectory = Values["Directory"].as< std::string >();

    if ( !std::filesystem::is_directory( WorkingDirectory ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The given working directory " << WorkingDirectory
                   << " is not a directory";

      throw std::invalid_argument( ErrorMessage.str() );
    }
  }

  // The forecast files are verified to exist

  SpotFile = CheckFile( Values["SpotPrice"].as< std::string >(), "spot price" );

  if ( Values.count("Load") > 0 )
    LoadFile = CheckFile( Values["Load"].as< std::string >(), "load" );

  if ( Values.count("PV") > 0 )
    PVFile = CheckFile( Values["PV"].as< std::string >(), "solar power" );

  if ( Values.count("Irradiance") > 0 )
    IrradianceFile = CheckFile( Values["Irradiance"].as< std::string >(),
                                "irradiance" );

  if ( Values.count("AirTemperature") > 0 )
    AirTemperatureFile = CheckFile( Values["AirTemperature"].as< std::string >(),
                                    "air temperature" );

  if ( Values.count("Ambient") > 0 )
    AmbientFile = CheckFile( Values["Ambient"].as< std::string >(),
                             "ambient temperature" );

  if ( Values.count("Results") > 0 )
	  Results = Values["Results"].as< std::string >();

  // Household parameters

  if ( Values.count("BaseLoad") > 0 )
    BaseLoadValue = Values["BaseLoad"].as< double >();

  if ( Values.count("WindSpeed") > 0 )
    WindSpeedValue = Values["WindSpeed"].as< double >();

  if ( Values.count("PVCapacity") > 0 )
    PVCapacityValue = Values["PVCapacity"].as< double >();

  if ( Values.count("BatteryCapacity") > 0 )
    BatteryCapacityValue = Values["BatteryCapacity"].as< double >();

  CurtailPV = Values["Curtail"].as< bool >();
  WithEV    = Values["EV"].as< bool >();

  if ( Values.count("Departure") > 0 )
    DailyTrip.Departure = Values["Departure"].as< long >();

  if ( Values.count("Arrival") > 0 )
    DailyTrip.Arrival = Values["Arrival"].as< long >();

  if ( Values.count("TripEnergy") > 0 )
    DailyTrip.Energy = Values["TripEnergy"].as< double >();

  // Optimisation parameters

  if ( Values.count("Horizon") > 0 )
    Steps = Values["Horizon"].as< Dimension >();

  if ( Values.count("StepDuration") > 0 )
    StepLength = Values["StepDuration"].as< double >();

  if ( Values.count("Steps") > 0 )
    Iterations = Values["Steps"].as< Dimension >();

  if ( Values.count("Objective") > 0 )
    Mode = EnergyManager::ParseObjective( Values["Objective"].as< std::string >() );

  // The tariff starts from the supplier preset, and individual fees given
  // as options override the preset.

  if ( Values.count("Supplier") > 0 )
    Contract.ApplySupplier( Values["Supplier"].as< std::string >() );

  if ( Values.count("ProcurementFee") > 0 )
    Contract.ProcurementFee = Values["ProcurementFee"].as< double >();

  if ( Values.count("SellBackCredit") > 0 )
    Contract.SellBackCredit = Values["SellBackCredit"].as< double >();

  if ( Values.count("EnergyTax") > 0 )
    Contract.EnergyTax = Values["EnergyTax"].as< double >();

  if ( Values.count("VAT") > 0 )
    Contract = Tariff( Contract.SpotPrice, Contract.ProcurementFee,
                       Contract.SellBackCredit, Contract.EnergyTax,
                       Values["VAT"].as< double >() );

  Contract.NetMetering = Values["NetMetering"].as< bool >();

  // Solver parameters

  if ( Values.count("Solver") > 0 )
    SolverID = Values["Solver"].as< std::string >();

  if ( Values.count("TimeLimit") > 0 )
    SolverSettings.TimeLimit = std::chrono::milliseconds(
      std::llround( 1000.0 * Values["TimeLimit"].as< double >() ) );

  if ( Values.count("Gap") > 0 )
    SolverSettings.RelativeGap = Values["Gap"].as< double >();

  // The log level must be one of the Boost Log trivial severity levels

  if ( Values.count("LogLevel") > 0 )
  {
    std::string LevelName = Values["LogLevel"].as< std::string >();

    if ( !boost::log::trivial::from_string( LevelName.data(), LevelName.size(),
                                            Level ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The log level \"" << LevelName << "\" is unknown";

      throw std::invalid_argument( ErrorMessage.str() );
    }
  }
}
