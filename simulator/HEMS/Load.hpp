/*==============================================================================
Load

The loads are the electrical consumers of the household that are not storage
devices. The fixed load has a given consumption profile, typically a forecast
of the base load of the household, and it contributes no constraints. The
profile can be updated as the forecast changes, and the new profile will be
used by the next solution of the problem.

The flexible load has a controllable non-negative power. It may be limited by
a maximum power, and it can be required to consume a given amount of energy
over the horizon, for instance to run a dishwasher or to heat a hot water
tank. The energy requirement is always part of the problem, and a requirement
of zero is trivially satisfied.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_LOAD
#define HEMS_LOAD

#include <string>                  // Names
#include <optional>                // Step duration

#include "Linear.hpp"              // Linear optimization problems
#include "Typedefs.hpp"            // HEMS types
#include "Trajectory.hpp"          // Power trajectory
#include "Component.hpp"           // Component interface

namespace HEMS
{
// -----------------------------------------------------------------------------
// Fixed load
// -----------------------------------------------------------------------------

class FixedLoad : public Component
{
private:

  PowerTrajectory Demand;

public:

  virtual const PowerTrajectory & Power( void ) const override
  { return Demand; }

  virtual Linear::Constraints Constraints( void ) override
  { return Linear::Constraints(); }

  inline void SetProfile( const TimeSeries & NewProfile )
  { Demand.SetProfile( NewProfile ); }

  FixedLoad( const TimeSeries & Profile, const std::string & Name = "load" )
  : Component(), Demand( Name, Profile )
  {}

  FixedLoad( void ) = delete;

  virtual ~FixedLoad( void )
  {}
};

// -----------------------------------------------------------------------------
// Flexible load
// -----------------------------------------------------------------------------

class FlexibleLoad : public Component
{
private:

  const double StepLength;
  double       MaxPower, RequiredEnergy;

  PowerTrajectory Demand;

public:

  virtual const PowerTrajectory & Power( void ) const override
  { return Demand; }

  virtual std::optional< double > StepDuration( void ) const override
  { return StepLength; }

  // The constraint on the energy consumed over the horizon

  virtual Linear::Constraints Constraints( void ) override;

  // The limits can be changed between solutions, and they cannot be
  // negative.

  void SetMaxPower( double Limit );
  void SetRequiredEnergy( double Energy );

  inline double GetMaxPower( void ) const
  { return MaxPower; }

  inline double GetRequiredEnergy( void ) const
  { return RequiredEnergy; }

  FlexibleLoad( Dimension Horizon,
                double StepDuration = DefaultStepDuration,
                double MaximumPower = Linear::Infinity,
                double EnergyRequirement = 0.0,
                const std::string & Name = "flexible load" );

  FlexibleLoad( void ) = delete;

  virtual ~FlexibleLoad( void )
  {}
};

}      // End name space HEMS
#endif // HEMS_LOAD
