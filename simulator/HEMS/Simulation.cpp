/*==============================================================================
Simulation

Implementation of the rolling horizon simulation of the household.

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#include <cmath>                   // Rounding
#include <fstream>                 // Result file
#include <iostream>                // Summary
#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include <boost/log/trivial.hpp>   // Diagnostic messages

#include "CSVtoTimeSeries.hpp"     // Reading forecasts
#include "Simulation.hpp"

// -----------------------------------------------------------------------------
// Forecasts
// -----------------------------------------------------------------------------

std::unique_ptr< HEMS::Resampler > HEMS::Simulation::ReadForecast(
  const std::optional< std::filesystem::path > & File,
  Resampler::Method Interpolation )
{
  if ( File )
    return std::make_unique< Resampler >( CSVtoTimeSeries( File->string() ),
                                          Interpolation );
  else
    return std::unique_ptr< Resampler >();
}

HEMS::TimeSeries HEMS::Simulation::Forecast( Resampler & Samples,
                                             Dimension Iteration ) const
{
  return Samples.Grid( Options.Horizon(), Options.StepDuration(),
                       Iteration * Options.StepDuration() );
}

// The solar power is either given directly or computed from the irradiance
// and the air temperature. The air temperature is taken as 20°C if it is not
// given.

HEMS::TimeSeries HEMS::Simulation::SolarForecast( Dimension Iteration ) const
{
  if ( SolarPower )
    return Forecast( *SolarPower, Iteration );

  TimeSeries Air( Options.Horizon(), 20.0 ),
             Wind( Options.Horizon(), Options.WindSpeed() );

  if ( AirTemperature )
    Air = Forecast( *AirTemperature, Iteration );

  return PVModel->MaximumPower( Forecast( *Irradiance, Iteration ), Air, Wind );
}

HEMS::TimeSeries HEMS::Simulation::LoadForecast( Dimension Iteration ) const
{
  if ( BaseLoad )
    return Forecast( *BaseLoad, Iteration );
  else
    return TimeSeries( Options.Horizon(), Options.BaseLoad() );
}

HEMS::Tariff HEMS::Simulation::PriceForecast( Dimension Iteration ) const
{
  Tariff Prices( Options.Prices() );

  Prices.SpotPrice = Forecast( *SpotPrice, Iteration );

  return Prices;
}

// The commute is repeated every day and shifted to the start of the
// horizon. A trip in progress has its departure moved to the start of the
// horizon without energy since the energy was taken at the real departure.

std::vector< HEMS::ElectricVehicle::Trip >
HEMS::Simulation::Trips( Dimension Iteration ) const
{
  const long Day   = std::lround( 24.0 / Options.StepDuration() ),
             Start = static_cast< long >( Iteration ),
             End   = Start + static_cast< long >( Options.Horizon() );

  const ElectricVehicle::Trip & Commute( Options.Commute() );
  std::vector< ElectricVehicle::Trip > Shifted;

  for ( long Offset = 0; Offset + Commute.Departure < End; Offset += Day )
  {
    long Departure = Offset + Commute.Departure - Start,
         Arrival   = Offset + Commute.Arrival   - Start;

    if ( Departure >= 0 )
      Shifted.push_back( ElectricVehicle::Trip{ Departure, Arrival,
                                                Commute.Energy } );
    else if ( Arrival > 0 )
      Shifted.push_back( ElectricVehicle::Trip{ 0, Arrival, 0.0 } );
  }

  return Shifted;
}

void HEMS::Simulation::Update( Dimension Iteration )
{
  House->SetProfile( LoadForecast( Iteration ) );

  if ( PV )
    PV->SetMaximumPower( SolarForecast( Iteration ) );

  if ( HP )
    HP->SetAmbientTemperature( Forecast( *Ambient, Iteration ) );

  if ( EV )
    EV->ScheduleTrips( Trips( Iteration ) );

  Manager->SetTariff( PriceForecast( Iteration ) );
}

// -----------------------------------------------------------------------------
// Running
// -----------------------------------------------------------------------------

double HEMS::Simulation::Run( void )
{
  std::ofstream Results( Options.ResultFile() );

  if ( !Results )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The result file " << Options.ResultFile()
                 << " could not be opened";

    throw std::runtime_error( ErrorMessage.str() );
  }

  Results << "step,time,spot,import,export,load,pv,heat_pump,battery,"
          << "battery_energy,ev,ev_energy,cost" << std::endl;

  const double dt = Options.StepDuration();
  double TotalCost = 0.0;

  for ( Dimension Iteration = 0; Iteration < Options.RollingSteps(); Iteration++ )
  {
    if ( Iteration > 0 )
    {
      Manager->Step();
      Update( Iteration );
    }

    EnergyManager::Result Solution = Manager->Solve( Options.Settings() );
    const Tariff & Prices = Manager->GetTariff();

    // The cost of the realised first time step

    double Cost = dt * ( Prices.ImportPrice( 0 ) * Solution.Import.front()
                       - Prices.ExportPrice( 0 ) * Solution.Export.front() );

    TotalCost += Cost;

    Results << Iteration << ',' << Iteration * dt << ','
            << Prices.SpotPrice.front() << ','
            << Solution.Import.front() << ',' << Solution.Export.front() << ','
            << House->Power().Values().front() << ','
            << ( PV ? PV->Power().Values().front() : 0.0 ) << ','
            << ( HP ? HP->Power().Values().front() : 0.0 ) << ',';

    if ( HomeBattery )
      Results << HomeBattery->Power().Values().front() << ','
              << HomeBattery->Storage().Energy[ 0 ]->Value() << ',';
    else
      Results << "0,0,";

    if ( EV )
      Results << EV->Power().Values().front() << ','
              << EV->Storage().Energy[ 0 ]->Value() << ',';
    else
      Results << "0,0,";

    Results << Cost << std::endl;

    BOOST_LOG_TRIVIAL( info ) << "Step " << Iteration << " imports "
                              << Solution.Import.front() << " kW and exports "
                              << Solution.Export.front() << " kW at cost "
                              << Cost << " €";
  }

  Manager->Summary( std::cout );

  BOOST_LOG_TRIVIAL( info ) << "The cost of " << Options.RollingSteps()
                            << " steps is " << TotalCost << " €";

  return TotalCost;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
//
// The prices are held constant between the samples while the physical
// quantities are interpolated. Steffen's method is used for the solar power
// and the irradiance to avoid negative values between samples.

HEMS::Simulation::Simulation( const CommandLineOptions & TheOptions )
: Options( TheOptions ),
  SpotPrice( ReadForecast( Options.SpotPriceFile(),
                           Resampler::Method::SampleAndHold ) ),
  BaseLoad( ReadForecast( Options.LoadForecast(), Resampler::Method::Linear ) ),
  SolarPower( ReadForecast( Options.PVForecast(),
                            Resampler::Method::Steffen ) ),
  Irradiance( ReadForecast( Options.IrradianceForecast(),
                            Resampler::Method::Steffen ) ),
  AirTemperature( ReadForecast( Options.AirTemperatureForecast(),
                                Resampler::Method::Linear ) ),
  Ambient( ReadForecast( Options.AmbientForecast(),
                         Resampler::Method::Linear ) ),
  PVModel(), House(), PV(), HP(), HomeBattery(), EV(), Manager()
{
  const Dimension T  = Options.Horizon();
  const double    dt = Options.StepDuration();

  EnergyManager::Components Household;

  House = std::make_shared< FixedLoad >( LoadForecast( 0 ), "base load" );
  Household.Loads.push_back( House );

  if ( Ambient )
  {
    HP = std::make_shared< HeatPump >( Forecast( *Ambient, 0 ), dt );
    Household.Loads.push_back( HP );
  }

  if ( !SolarPower && Irradiance )
    PVModel.emplace( Options.PVCapacity() );

  if ( SolarPower || Irradiance )
  {
    PV = std::make_shared< Solar >( SolarForecast( 0 ),
           Options.Curtailable() ? Solar::Mode::Curtailable : Solar::Mode::Fixed );
    Household.PVs.push_back( PV );
  }

  if ( Options.HasElectricVehicle() )
  {
    EV = std::make_shared< ElectricVehicle >( T, dt,
           ElectricVehicle::StandardParameters(), Trips( 0 ) );
    Household.EVs.push_back( EV );
  }

  if ( Options.BatteryCapacity() > 0.0 )
  {
    HomeBattery = std::make_shared< Battery >( T, dt,
                    Battery::StandardParameters( Options.BatteryCapacity() ) );
    Household.HomeBattery = HomeBattery;
  }

  Manager = std::make_unique< EnergyManager >( Household, PriceForecast( 0 ),
              Options.Objective(), T, dt, Options.Solver() );
}
