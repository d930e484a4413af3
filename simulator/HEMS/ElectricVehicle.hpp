/*==============================================================================
Electric vehicle

The electric vehicle is a storage that is only connected to the household
when it is at home. It is away on trips, and each trip is given by the time
step of departure, the time step of arrival and the energy consumed during
the trip. The vehicle cannot charge or discharge while it is away, and the
energy consumed by the trip is removed from the battery at the departure.

The availability is a time series being one when the vehicle is at home and
zero when it is away, and the charging and discharging powers are limited by
the maximum power times the availability. The availability and the energy
drain of the storage are computed from the trips when they are scheduled, and
trips may be rescheduled between solutions.

A trip departing outside of the horizon is ignored. A trip arriving after
the end of the horizon makes the vehicle unavailable until the end of the
horizon. If two trips depart at the same time step, the energy of the last
trip is used.

The standard parameters correspond to a 50 kWh vehicle charging at 7 kW with
90% efficiency, starting and ending with 20 kWh and not able to discharge to
the household (no vehicle-to-grid). The default trip is a commute leaving at
08:00 and returning at 18:00 using 10 kWh, with a 15 minutes time step.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_ELECTRIC_VEHICLE
#define HEMS_ELECTRIC_VEHICLE

#include <string>                  // Names
#include <vector>                  // Trips
#include <optional>                // Step duration

#include "Linear.hpp"              // Linear optimization problems
#include "Typedefs.hpp"            // HEMS types
#include "Trajectory.hpp"          // Power trajectory
#include "Component.hpp"           // Component interface
#include "Storage.hpp"             // Storage state

namespace HEMS
{

class ElectricVehicle : public Component
{
public:

  // The time steps of a trip are signed since a trip may have departed
  // before the current horizon.

  struct Trip
  {
    long   Departure;
    long   Arrival;
    double Energy;
  };

  static StorageState::Parameters StandardParameters( void );
  static std::vector< Trip >      DefaultCommute( void );

private:

  StorageState        State;
  TimeSeries          Availability;
  std::vector< Trip > Trips;

public:

  inline StorageState & Storage( void )
  { return State; }

  inline const StorageState & Storage( void ) const
  { return State; }

  inline const TimeSeries & GetAvailability( void ) const
  { return Availability; }

  inline const std::vector< Trip > & GetTrips( void ) const
  { return Trips; }

  // Scheduling the trips replaces all previous trips.

  void ScheduleTrips( const std::vector< Trip > & NewTrips );

  virtual const PowerTrajectory & Power( void ) const override
  { return State.NetPower; }

  virtual std::optional< double > StepDuration( void ) const override
  { return State.StepDuration; }

  // The constraints are the ones of the storage and the availability
  // limits on the power.

  virtual Linear::Constraints Constraints( void ) override;

  ElectricVehicle( Dimension Horizon,
                   double StepDuration = DefaultStepDuration,
                   const StorageState::Parameters & Values = StandardParameters(),
                   const std::vector< Trip > & TheTrips = DefaultCommute(),
                   const std::string & Name = "ev" );

  ElectricVehicle( void ) = delete;

  virtual ~ElectricVehicle( void )
  {}
};

}      // End name space HEMS
#endif // HEMS_ELECTRIC_VEHICLE
