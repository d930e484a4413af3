/*==============================================================================
Solar

Implementation of the solar generation component.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#include <algorithm>               // Transform
#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include "Solar.hpp"

using Optimization::Coefficient;
using Optimization::VariableType;

HEMS::TimeSeries HEMS::Solar::Clamp( const TimeSeries & Forecast )
{
  TimeSeries Ceiling( Forecast.size() );

  std::transform( Forecast.begin(), Forecast.end(), Ceiling.begin(),
                  []( double Value ){ return std::max( Value, 0.0 ); } );

  return Ceiling;
}

// The produced power is bounded below by zero for the curtailable mode and
// the upper limit is given by the constraints.

HEMS::PowerTrajectory HEMS::Solar::MakeTrajectory( const std::string & Name,
                                                   const TimeSeries & Ceiling,
                                                   Mode TheMode )
{
  if ( TheMode == Mode::Fixed )
    return PowerTrajectory( Name, Ceiling );
  else
    return PowerTrajectory( Name, Ceiling.size(), Optimization::Constant( 0.0 ),
                            Optimization::Constant( Linear::Infinity ) );
}

void HEMS::Solar::SetMaximumPower( const TimeSeries & Forecast )
{
  CheckLength( Forecast, Generation.Horizon, "solar forecast of " + Name() );

  MaximumPower = Clamp( Forecast );

  if ( Operation == Mode::Fixed )
    Generation.SetProfile( MaximumPower );
}

HEMS::TimeSeries HEMS::Solar::Curtailment( void ) const
{
  TimeSeries Produced( Generation.Values() ),
             Curtailed( Produced.size() );

  std::transform( MaximumPower.begin(), MaximumPower.end(), Produced.begin(),
                  Curtailed.begin(), []( double Available, double Used ){
                    return std::max( Available - Used, 0.0 ); } );

  return Curtailed;
}

HEMS::Linear::Constraints HEMS::Solar::Constraints( void )
{
  Linear::Constraints Rows;

  if ( Operation == Mode::Curtailable )
    for ( Dimension t = 0; t < Generation.Horizon; t++ )
      Rows.Add( Linear::LessEqual(
        Name() + ".ceiling[" + std::to_string( t ) + "]", Generation[ t ],
        Coefficient( [this, t]( void )->VariableType{
          return MaximumPower[ t ]; } ) ) );

  return Rows;
}

HEMS::Solar::Solar( const TimeSeries & Forecast, Mode TheMode,
                    const std::string & Name )
: Component(), Operation( TheMode ), MaximumPower( Clamp( Forecast ) ),
  Generation( MakeTrajectory( Name, MaximumPower, TheMode ) )
{}
