/*==============================================================================
Load

Implementation of the flexible load. The fixed load is fully defined by its
header.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include "Load.hpp"

// The energy consumed over the horizon is the sum of the power values
// multiplied with the step duration.

HEMS::Linear::Constraints HEMS::FlexibleLoad::Constraints( void )
{
  Linear::Expression Energy;

  for ( Dimension t = 0; t < Demand.Horizon; t++ )
    Energy.Add( Demand.Variables()[ t ], StepLength );

  Linear::Constraints Rows;

  Rows.Add( Linear::GreaterEqual( Name() + ".energy", Energy,
    Optimization::Coefficient(
      [this]( void )->Optimization::VariableType{ return RequiredEnergy; } ) ) );

  return Rows;
}

void HEMS::FlexibleLoad::SetMaxPower( double Limit )
{
  if ( Limit < 0.0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The maximum power of " << Name() << " cannot be "
                 << "negative (" << Limit << ")";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  MaxPower = Limit;
}

void HEMS::FlexibleLoad::SetRequiredEnergy( double Energy )
{
  if ( Energy < 0.0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The required energy of " << Name() << " cannot be "
                 << "negative (" << Energy << ")";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  RequiredEnergy = Energy;
}

// The upper bound of the power variables reads the maximum power so that it
// can be changed between two solutions.

HEMS::FlexibleLoad::FlexibleLoad( Dimension Horizon, double StepDuration,
                                  double MaximumPower, double EnergyRequirement,
                                  const std::string & Name )
: Component(), StepLength( StepDuration ),
  MaxPower( 0.0 ), RequiredEnergy( 0.0 ),
  Demand( Name, Horizon, Optimization::Constant( 0.0 ),
          [this]( void )->Optimization::VariableType{ return MaxPower; } )
{
  if ( StepDuration <= 0.0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The step duration of " << Name << " must be positive";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  SetMaxPower( MaximumPower );
  SetRequiredEnergy( EnergyRequirement );
}
