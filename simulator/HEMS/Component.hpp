/*==============================================================================
Component

A component is any device of the household that consumes or produces
electrical power: the base load, flexible loads, the heat pump, the home
battery, the electric vehicle and the solar panels. Every component has a
power trajectory over the optimization horizon, and it contributes the set of
linear constraints that describe its physics to the optimization problem.

The components are assembled by the energy manager, which needs to know the
horizon and the step duration of the components to ensure that they agree,
the power of every component at each time step for the power balance, and the
constraints of the components. This is the capability defined here. Components
without any physical constraints simply return an empty set.

The constraints of a component refer to its parameters through coefficient
functions, and a component must therefore stay at the same memory location
as long as it is used by a problem. The components are not copyable, and the
energy manager holds them by shared pointers.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_COMPONENT
#define HEMS_COMPONENT

#include <string>                  // Names
#include <optional>                // Step duration

#include "Linear.hpp"              // Linear optimization problems
#include "Typedefs.hpp"            // HEMS types
#include "Trajectory.hpp"          // Power trajectory

namespace HEMS
{

class Component
{
public:

  // The power trajectory is the only mandatory part of a component.

  virtual const PowerTrajectory & Power( void ) const = 0;

  // The name and horizon are the ones of the power trajectory

  inline std::string Name( void ) const
  { return Power().Name; }

  inline Dimension Horizon( void ) const
  { return Power().Horizon; }

  // Components that integrate power to energy have a step duration, and
  // the components without one are valid for any step duration.

  virtual std::optional< double > StepDuration( void ) const
  { return std::nullopt; }

  virtual Linear::Constraints Constraints( void ) = 0;

protected:

  Component( void )
  {}

public:

  Component( const Component & Other ) = delete;

  virtual ~Component( void )
  {}
};

}      // End name space HEMS
#endif // HEMS_COMPONENT
