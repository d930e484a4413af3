/*==============================================================================
Solar

The solar panels produce power up to the maximum power available from the
sun at each time step. The maximum power is a forecast given to the model,
and it is never negative since negative values from numerical artefacts of
the forecast are clamped to zero when the forecast is given.

The generation is either fixed, in which case the produced power equals the
maximum power, or curtailable, in which case the produced power is a decision
variable between zero and the maximum power. Curtailment is interesting when
the export price is negative, and the household would pay to export.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_SOLAR
#define HEMS_SOLAR

#include <string>                  // Names

#include "Linear.hpp"              // Linear optimization problems
#include "Typedefs.hpp"            // HEMS types
#include "Trajectory.hpp"          // Power trajectory
#include "Component.hpp"           // Component interface

namespace HEMS
{

class Solar : public Component
{
public:

  enum class Mode
  {
    Fixed,
    Curtailable
  };

  const Mode Operation;

private:

  TimeSeries      MaximumPower;
  PowerTrajectory Generation;

  static TimeSeries Clamp( const TimeSeries & Forecast );

  static PowerTrajectory MakeTrajectory( const std::string & Name,
                                         const TimeSeries & Ceiling,
                                         Mode TheMode );

public:

  inline bool Curtailable( void ) const
  { return Operation == Mode::Curtailable; }

  inline const TimeSeries & GetMaximumPower( void ) const
  { return MaximumPower; }

  // A new forecast must have the same length as the horizon

  void SetMaximumPower( const TimeSeries & Forecast );

  // The curtailed power is the difference between the available power and
  // the power produced, and it is only available after a solution.

  TimeSeries Curtailment( void ) const;

  virtual const PowerTrajectory & Power( void ) const override
  { return Generation; }

  virtual Linear::Constraints Constraints( void ) override;

  Solar( const TimeSeries & Forecast, Mode TheMode = Mode::Fixed,
         const std::string & Name = "pv" );

  Solar( void ) = delete;

  virtual ~Solar( void )
  {}
};

}      // End name space HEMS
#endif // HEMS_SOLAR
