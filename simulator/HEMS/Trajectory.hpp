/*==============================================================================
Power trajectory

The power trajectory is the power of a component over the time steps of the
optimization horizon. It is either a fixed time series given by external
data, like a forecast for the base load of a house, or it is a decision
variable for every time step if the component is controllable.

The trajectory is accessed per time step as a linear expression. For a fixed
trajectory the expression is a constant whose value is read from the profile
when the problem is refreshed. The profile can therefore be replaced by a new
forecast between two solutions without changing the structure of the problem.
For a controllable trajectory the expression is just the variable of the time
step.

The sign of the power is defined by the component owning the trajectory. For
loads and storage a positive value means consumption, while for producers a
positive value is generation.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_TRAJECTORY
#define HEMS_TRAJECTORY

#include <string>                  // Names
#include <optional>                // Decision variables

#include "Linear.hpp"              // Linear optimization problems
#include "Typedefs.hpp"            // HEMS types

namespace HEMS
{

class PowerTrajectory
{
public:

  const std::string Name;
  const Dimension   Horizon;

private:

  TimeSeries                              Profile;
  std::optional< Linear::VariableVector > Decision;

public:

  inline bool IsFixed( void ) const
  { return !Decision.has_value(); }

  // The expression for a given time step

  Linear::Expression operator[] ( Dimension t ) const;

  // The values are the profile for a fixed trajectory and the solution
  // values for a controllable trajectory, and for the latter the values are
  // only available after a solution.

  TimeSeries Values( void ) const;
  bool       Solved( void ) const;

  // The profile of a fixed trajectory can be replaced, and the decision
  // variables can be accessed for a controllable trajectory. Both will
  // throw if used on the wrong type of trajectory.

  void SetProfile( const TimeSeries & NewProfile );
  const Linear::VariableVector & Variables( void ) const;

  // The fixed trajectory is constructed from the profile, and the
  // controllable trajectory from the horizon and the bounds on the power.

  PowerTrajectory( const std::string & TheName, const TimeSeries & FixedProfile );

  PowerTrajectory( const std::string & TheName, Dimension TheHorizon,
                   const Optimization::Coefficient & Lower,
                   const Optimization::Coefficient & Upper );

  PowerTrajectory( void ) = delete;
  PowerTrajectory( const PowerTrajectory & Other ) = delete;
};

}      // End name space HEMS
#endif // HEMS_TRAJECTORY
