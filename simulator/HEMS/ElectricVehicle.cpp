/*==============================================================================
Electric vehicle

Implementation of the trip scheduling and the availability constraints.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#include <algorithm>               // Min and max
#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include <boost/numeric/conversion/cast.hpp> // Casting numeric types
#include <boost/log/trivial.hpp>             // Diagnostic messages

#include "ElectricVehicle.hpp"

using Optimization::Coefficient;
using Optimization::VariableType;

// -----------------------------------------------------------------------------
// Standard values
// -----------------------------------------------------------------------------

HEMS::StorageState::Parameters
HEMS::ElectricVehicle::StandardParameters( void )
{
  StorageState::Parameters Values;

  Values.Capacity            = 50.0;
  Values.MaxCharge           = 7.0;
  Values.MaxDischarge        = 0.0;
  Values.ChargeEfficiency    = 0.9;
  Values.DischargeEfficiency = 0.9;
  Values.InitialEnergy       = 20.0;
  Values.TerminalEnergy      = 20.0;

  return Values;
}

std::vector< HEMS::ElectricVehicle::Trip >
HEMS::ElectricVehicle::DefaultCommute( void )
{
  return { Trip{ 32, 72, 10.0 } };
}

// -----------------------------------------------------------------------------
// Trips
// -----------------------------------------------------------------------------
//
// The availability and the drain are first reset, and then every trip
// departing within the horizon sets the drain at departure and makes the
// vehicle unavailable until it arrives or the horizon ends.

void HEMS::ElectricVehicle::ScheduleTrips( const std::vector< Trip > & NewTrips )
{
  const long Steps = boost::numeric_cast< long >( State.Horizon );
  TimeSeries NewDrain( State.Horizon, 0.0 ),
             NewAvailability( State.Horizon, 1.0 );

  for ( const Trip & TheTrip : NewTrips )
  {
    if ( TheTrip.Energy < 0.0 )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The trip of " << Name() << " departing at step "
                   << TheTrip.Departure << " cannot consume negative energy";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    if ( TheTrip.Departure < 0 || TheTrip.Departure >= Steps )
    {
      BOOST_LOG_TRIVIAL( warning ) << "The trip of " << Name()
        << " departing at step " << TheTrip.Departure
        << " is outside the horizon of " << Steps << " steps and ignored";
      continue;
    }

    NewDrain[ TheTrip.Departure ] = TheTrip.Energy;

    for ( long t = TheTrip.Departure; t < std::min( TheTrip.Arrival, Steps ); t++ )
      NewAvailability[ t ] = 0.0;
  }

  State.SetDrain( NewDrain );
  Availability = NewAvailability;
  Trips        = NewTrips;
}

// -----------------------------------------------------------------------------
// Constraints
// -----------------------------------------------------------------------------

HEMS::Linear::Constraints HEMS::ElectricVehicle::Constraints( void )
{
  Linear::Constraints Rows( State.Constraints() );

  for ( Dimension t = 0; t < State.Horizon; t++ )
  {
    std::string Step = "[" + std::to_string( t ) + "]";

    Rows.Add( Linear::LessEqual( Name() + ".charge_available" + Step,
      State.Charge[ t ],
      Coefficient( [this, t]( void )->VariableType{
        return State.GetParameters().MaxCharge * Availability[ t ]; } ) ) );

    Rows.Add( Linear::LessEqual( Name() + ".discharge_available" + Step,
      State.Discharge[ t ],
      Coefficient( [this, t]( void )->VariableType{
        return State.GetParameters().MaxDischarge * Availability[ t ]; } ) ) );
  }

  return Rows;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------

HEMS::ElectricVehicle::ElectricVehicle( Dimension Horizon, double StepDuration,
                                        const StorageState::Parameters & Values,
                                        const std::vector< Trip > & TheTrips,
                                        const std::string & Name )
: Component(), State( Name, Horizon, StepDuration, Values ),
  Availability( Horizon, 1.0 ), Trips()
{
  ScheduleTrips( TheTrips );
}
