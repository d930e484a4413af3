/*==============================================================================
PVWatts

Implementation of the PVWatts generation model.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#include <cmath>                   // Exponential function
#include <algorithm>               // Min and max
#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include "PVWatts.hpp"

// The open rack glass/glass parameters of the Sandia model: a, b and the
// temperature difference between the cell and the module back at
// 1000 W/m².

double HEMS::PVWatts::CellTemperature( double Irradiance, double AirTemperature,
                                       double WindSpeed )
{
  constexpr double a = -3.47, b = -0.0594, DeltaT = 3.0;

  double ModuleTemperature =
         Irradiance * std::exp( a + b * WindSpeed ) + AirTemperature;

  return ModuleTemperature + Irradiance / 1000.0 * DeltaT;
}

double HEMS::PVWatts::DCPower( double Irradiance, double CellTemperature ) const
{
  return std::max( 0.0, Irradiance / 1000.0 * DCCapacity *
                   ( 1.0 + TemperatureCoefficient * ( CellTemperature - 25.0 ) ) );
}

// The inverter efficiency depends on the load relative to the DC input
// rating of the inverter, and the reference efficiency normalises the curve.

double HEMS::PVWatts::ACPower( double DCPower ) const
{
  constexpr double ReferenceEfficiency = 0.9637;

  if ( DCPower <= 0.0 ) return 0.0;

  double InputRating = ACCapacity / InverterEfficiency,
         Zeta        = DCPower / InputRating,
         Efficiency  = InverterEfficiency / ReferenceEfficiency *
                       ( -0.0162 * Zeta - 0.0059 / Zeta + 0.9858 );

  return std::clamp( Efficiency * DCPower, 0.0, ACCapacity );
}

HEMS::TimeSeries
HEMS::PVWatts::MaximumPower( const TimeSeries & Irradiance,
                             const TimeSeries & AirTemperature,
                             const TimeSeries & WindSpeed ) const
{
  CheckLength( AirTemperature, Irradiance.size(), "air temperature forecast" );
  CheckLength( WindSpeed, Irradiance.size(), "wind speed forecast" );

  TimeSeries Power( Irradiance.size() );

  for ( Dimension t = 0; t < Irradiance.size(); t++ )
    Power[ t ] = ACPower( DCPower( Irradiance[ t ],
      CellTemperature( Irradiance[ t ], AirTemperature[ t ], WindSpeed[ t ] ) ) );

  return Power;
}

HEMS::PVWatts::PVWatts( double NameplatePower,
                        double PowerTemperatureCoefficient,
                        double NominalInverterEfficiency,
                        std::optional< double > InverterRating )
: DCCapacity( NameplatePower ),
  ACCapacity( InverterRating.value_or( NameplatePower ) ),
  TemperatureCoefficient( PowerTemperatureCoefficient ),
  InverterEfficiency( NominalInverterEfficiency )
{
  if ( DCCapacity <= 0.0 || ACCapacity <= 0.0 ||
       InverterEfficiency <= 0.0 || InverterEfficiency > 1.0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The PV system must have positive power ratings and an "
                 << "inverter efficiency in (0,1]";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}
