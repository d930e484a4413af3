/*==============================================================================
Power trajectory

Implementation of the power trajectory access functions.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include "Trajectory.hpp"

// -----------------------------------------------------------------------------
// Expressions and values
// -----------------------------------------------------------------------------
//
// The fixed profile value is captured by reference to the trajectory so that
// a new profile is seen by the problem the next time it is refreshed.

HEMS::Linear::Expression HEMS::PowerTrajectory::operator[] ( Dimension t ) const
{
  if ( t >= Horizon )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The power of " << Name << " at time step " << t
                 << " is outside of the horizon [0," << Horizon << ")";

    throw std::out_of_range( ErrorMessage.str() );
  }

  if ( Decision )
    return Linear::Expression( (*Decision)[ t ] );
  else
    return Linear::Expression( Optimization::Coefficient(
      [this, t]( void )->Optimization::VariableType{ return Profile[ t ]; } ) );
}

HEMS::TimeSeries HEMS::PowerTrajectory::Values( void ) const
{
  if ( Decision )
    return Decision->Values();
  else
    return Profile;
}

bool HEMS::PowerTrajectory::Solved( void ) const
{
  if ( Decision )
    return Decision->Solved();
  else
    return true;
}

// -----------------------------------------------------------------------------
// Type specific access
// -----------------------------------------------------------------------------

void HEMS::PowerTrajectory::SetProfile( const TimeSeries & NewProfile )
{
  if ( Decision )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The power of " << Name << " is controllable and "
                 << "cannot be given a fixed profile";

    throw std::logic_error( ErrorMessage.str() );
  }

  CheckLength( NewProfile, Horizon, "power profile of " + Name );
  Profile = NewProfile;
}

const HEMS::Linear::VariableVector &
HEMS::PowerTrajectory::Variables( void ) const
{
  if ( Decision )
    return Decision.value();
  else
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The power of " << Name << " is a fixed profile "
                 << "and has no decision variables";

    throw std::logic_error( ErrorMessage.str() );
  }
}

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------

HEMS::PowerTrajectory::PowerTrajectory( const std::string & TheName,
                                        const TimeSeries & FixedProfile )
: Name( TheName ), Horizon( FixedProfile.size() ),
  Profile( FixedProfile ), Decision()
{
  if ( FixedProfile.empty() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The fixed power profile of " << Name << " is empty";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

HEMS::PowerTrajectory::PowerTrajectory( const std::string & TheName,
                                        Dimension TheHorizon,
                                        const Optimization::Coefficient & Lower,
                                        const Optimization::Coefficient & Upper )
: Name( TheName ), Horizon( TheHorizon ), Profile(),
  Decision( std::in_place, TheName + ".P", TheHorizon,
            Linear::Variable::Domain::Continuous, Lower, Upper )
{
  if ( TheHorizon == 0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The power of " << Name << " must have a horizon of at "
                 << "least one time step";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}
