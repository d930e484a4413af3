/*==============================================================================
Heat pump

Implementation of the building simulation and the COP model.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#include <algorithm>               // Min, max and clamp
#include <cmath>                   // Finite values
#include <utility>                 // Moving trajectories
#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include "HeatPump.hpp"

// -----------------------------------------------------------------------------
// Coefficient of performance
// -----------------------------------------------------------------------------

double HEMS::HeatPump::CoefficientOfPerformance( double Ambient ) const
{
  constexpr double Kelvin = 273.15;

  double Hot  = Pump.SupplyTemperature + Kelvin,
         Cold = Ambient + Kelvin;

  return std::clamp( Pump.CarnotEfficiency * Hot / std::max( Hot - Cold, 1.0 ),
                     Pump.MinCOP, Pump.MaxCOP );
}

// -----------------------------------------------------------------------------
// Simulation
// -----------------------------------------------------------------------------
//
// The heat loss is positive when heat leaves the building. The thermal power
// needed is the power that would bring the indoor temperature to the set
// point at the end of the step given the current losses and gains.

HEMS::HeatPump::Trajectories
HEMS::HeatPump::Simulate( const TimeSeries & Ambient ) const
{
  if ( Ambient.empty() || StepLength <= 0.0 ||
       House.Capacity <= 0.0 || House.HeatLoss < 0.0 ||
       Pump.MaxThermalPower < 0.0 || Pump.MinCOP <= 0.0 ||
       Pump.MinCOP > Pump.MaxCOP )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The heat pump needs an ambient temperature forecast, "
                 << "a positive step duration, a positive thermal capacity "
                 << "and a valid COP interval";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  const Dimension Steps = Ambient.size();
  Trajectories    Result{ TimeSeries( Steps + 1, House.InitialTemperature ),
                          TimeSeries( Steps, 0.0 ), TimeSeries( Steps, 0.0 ),
                          TimeSeries( Steps, 0.0 ) };

  for ( Dimension t = 0; t < Steps; t++ )
  {
    if ( !std::isfinite( Ambient[ t ] ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The ambient temperature at step " << t
                   << " is not a finite number";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    double HeatLoss = House.HeatLoss * ( Result.Indoor[ t ] - Ambient[ t ] );

    double Needed = House.Capacity *
                    ( House.SetPoint - Result.Indoor[ t ] ) / StepLength +
                    HeatLoss - House.InternalGains;

    Result.Thermal[ t ] = std::clamp( Needed, 0.0, Pump.MaxThermalPower );

    Result.Indoor[ t+1 ] = Result.Indoor[ t ] +
      StepLength / House.Capacity *
      ( Result.Thermal[ t ] + House.InternalGains - HeatLoss );

    Result.Performance[ t ] = CoefficientOfPerformance( Ambient[ t ] );
    Result.Electrical[ t ]  = Result.Thermal[ t ] / Result.Performance[ t ];
  }

  return Result;
}

HEMS::TimeSeries HEMS::HeatPump::Commit( Trajectories && Result )
{
  IndoorTemperature = std::move( Result.Indoor );
  ThermalPower      = std::move( Result.Thermal );
  COP               = std::move( Result.Performance );

  return std::move( Result.Electrical );
}

// The horizon cannot change since the problem structure depends on it.

void HEMS::HeatPump::SetAmbientTemperature( const TimeSeries & Forecast )
{
  CheckLength( Forecast, Electrical.Horizon,
               "ambient temperature forecast of " + Name() );

  Trajectories Result = Simulate( Forecast );

  AmbientTemperature = Forecast;
  Electrical.SetProfile( Commit( std::move( Result ) ) );
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------

HEMS::HeatPump::HeatPump( const TimeSeries & Ambient, double StepDuration,
                          const Building & TheHouse, const Unit & ThePump,
                          const std::string & Name )
: Component(), House( TheHouse ), Pump( ThePump ), StepLength( StepDuration ),
  AmbientTemperature( Ambient ), IndoorTemperature(), ThermalPower(), COP(),
  Electrical( Name, Commit( Simulate( Ambient ) ) )
{}
