/*==============================================================================
Battery

The home battery is a stationary storage connected to the household's
electrical system. Its power is the net power of the storage state, positive
when charging, and it contributes the storage constraints to the problem.

The standard parameters correspond to a typical home battery of 13.5 kWh with
5 kW charging and discharging power, 95% efficiency in both directions, and
starting and ending the horizon half full.

Author and Copyright: Geir Horn, 2016-2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_BATTERY
#define HEMS_BATTERY

#include <string>                  // Names
#include <optional>                // Step duration

#include "Linear.hpp"              // Linear optimization problems
#include "Typedefs.hpp"            // HEMS types
#include "Trajectory.hpp"          // Power trajectory
#include "Component.hpp"           // Component interface
#include "Storage.hpp"             // Storage state

namespace HEMS
{

class Battery : public Component
{
private:

  StorageState State;

public:

  static StorageState::Parameters StandardParameters( double Capacity = 13.5 );

  inline StorageState & Storage( void )
  { return State; }

  inline const StorageState & Storage( void ) const
  { return State; }

  virtual const PowerTrajectory & Power( void ) const override
  { return State.NetPower; }

  virtual std::optional< double > StepDuration( void ) const override
  { return State.StepDuration; }

  virtual Linear::Constraints Constraints( void ) override
  { return State.Constraints(); }

  Battery( Dimension Horizon,
           double StepDuration = DefaultStepDuration,
           const StorageState::Parameters & Values = StandardParameters(),
           const std::string & Name = "battery" )
  : Component(), State( Name, Horizon, StepDuration, Values )
  {}

  Battery( void ) = delete;

  virtual ~Battery( void )
  {}
};

}      // End name space HEMS
#endif // HEMS_BATTERY
