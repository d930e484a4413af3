/*==============================================================================
Storage state

Implementation of the storage state constraints and the parameter checks.

Author and Copyright: Geir Horn, 2016-2026
License: LGPL 3.0
==============================================================================*/

#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions
#include <algorithm>               // Any of

#include "Storage.hpp"

using Optimization::Coefficient;
using Optimization::VariableType;

// -----------------------------------------------------------------------------
// Parameters
// -----------------------------------------------------------------------------

void HEMS::StorageState::Validate( const Parameters & Candidate,
                                   const std::string & Name )
{
  std::ostringstream ErrorMessage;

  if ( Candidate.Capacity < 0.0 || Candidate.MaxCharge < 0.0 ||
       Candidate.MaxDischarge < 0.0 )
    ErrorMessage << "The capacity and the power limits of " << Name
                 << " cannot be negative";
  else if ( Candidate.ChargeEfficiency <= 0.0 ||
            Candidate.ChargeEfficiency > 1.0 ||
            Candidate.DischargeEfficiency <= 0.0 ||
            Candidate.DischargeEfficiency > 1.0 )
    ErrorMessage << "The efficiencies of " << Name << " must be in (0,1]";
  else if ( Candidate.InitialEnergy < 0.0 || Candidate.TerminalEnergy < 0.0 )
    ErrorMessage << "The initial and terminal energy of " << Name
                 << " cannot be negative";
  else
    return;

  throw std::invalid_argument( std::string( __FILE__ ) + " at line " +
                               std::to_string( __LINE__ ) + ": " +
                               ErrorMessage.str() );
}

void HEMS::StorageState::SetParameters( const Parameters & NewValues )
{
  Validate( NewValues, Name );
  Values = NewValues;
}

void HEMS::StorageState::SetInitialEnergy( double Energy )
{
  Parameters NewValues( Values );

  NewValues.InitialEnergy = Energy;
  SetParameters( NewValues );
}

void HEMS::StorageState::SetTerminalEnergy( double Energy )
{
  Parameters NewValues( Values );

  NewValues.TerminalEnergy = Energy;
  SetParameters( NewValues );
}

void HEMS::StorageState::SetDrain( const TimeSeries & NewDrain )
{
  CheckLength( NewDrain, Horizon, "energy drain of " + Name );

  if ( std::any_of( NewDrain.begin(), NewDrain.end(),
                    []( double Value ){ return Value < 0.0; } ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The energy drain of " << Name << " cannot be negative";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  Drain = NewDrain;
}

// -----------------------------------------------------------------------------
// Constraints
// -----------------------------------------------------------------------------
//
// The energy bounds are given as variable bounds, and the remaining
// relations are constraint rows. The coefficient functions read the current
// parameter values.

HEMS::Linear::Constraints HEMS::StorageState::Constraints( void )
{
  Linear::Constraints Rows;

  Coefficient ChargeFactor = [this]( void )->VariableType{
    return StepDuration * Values.ChargeEfficiency; };

  Coefficient DischargeFactor = [this]( void )->VariableType{
    return StepDuration / Values.DischargeEfficiency; };

  Coefficient ChargeLimit = [this]( void )->VariableType{
    return Values.MaxCharge; };

  Coefficient DischargeLimit = [this]( void )->VariableType{
    return Values.MaxDischarge; };

  Rows.Add( Linear::Equal( Name + ".initial", Energy[0],
    Coefficient( [this]( void )->VariableType{ return Values.InitialEnergy; })));

  for ( Dimension t = 0; t < Horizon; t++ )
  {
    std::string Step = "[" + std::to_string( t ) + "]";

    Linear::Expression Next( Energy[ t ] );

    Next.Add( Charge[ t ], ChargeFactor )
        .Add( Discharge[ t ], Optimization::Negate( DischargeFactor ) )
        .Add( Coefficient( [this, t]( void )->VariableType{
                return -Drain[ t ]; } ) );

    Rows.Add( Linear::Equal( Name + ".energy" + Step, Energy[ t+1 ], Next ) );

    Rows.Add( Linear::LessEqual( Name + ".charge_mode" + Step, Charge[ t ],
      Linear::Expression( Mode[ t ], ChargeLimit ) ) );

    Rows.Add( Linear::LessEqual( Name + ".discharge_mode" + Step,
      Linear::Expression( Discharge[ t ] ) +
      Linear::Expression( Mode[ t ], DischargeLimit ),
      Linear::Expression( DischargeLimit ) ) );

    Rows.Add( Linear::Equal( Name + ".net_power" + Step, NetPower[ t ],
      Linear::Expression( Charge[ t ] ) - Linear::Expression( Discharge[ t ] )));
  }

  Rows.Add( Linear::GreaterEqual( Name + ".terminal", Energy[ Horizon ],
    Coefficient( [this]( void )->VariableType{ return Values.TerminalEnergy; })));

  return Rows;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
//
// The upper bound of the energy is the capacity read when the problem is
// refreshed. The net power is free in both directions since it is bound
// through the charge and discharge powers.

HEMS::StorageState::StorageState( const std::string & TheName,
                                  Dimension TheHorizon, double TheStepDuration,
                                  const Parameters & TheValues )
: Name( TheName ), Horizon( TheHorizon ), StepDuration( TheStepDuration ),
  Values( TheValues ), Drain( TheHorizon, 0.0 ),
  Energy( TheName + ".E", TheHorizon + 1,
          Linear::Variable::Domain::Continuous, Optimization::Constant( 0.0 ),
          [this]( void )->VariableType{ return Values.Capacity; } ),
  Charge( TheName + ".P_ch", TheHorizon ),
  Discharge( TheName + ".P_dis", TheHorizon ),
  Mode( TheName + ".mode", TheHorizon, Linear::Variable::Domain::Binary ),
  NetPower( TheName, TheHorizon, Optimization::Constant( -Linear::Infinity ),
            Optimization::Constant( Linear::Infinity ) )
{
  if ( TheHorizon == 0 || TheStepDuration <= 0.0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The storage " << Name << " must have a positive horizon "
                 << "and a positive step duration";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  Validate( TheValues, TheName );
}
