/*==============================================================================
Type definitions

The purpose of this file is to group all type definitions in one place to
ensure that all classes uses the same definitions and so that they are not
depending on including other class definitions that may not be needed.

All power values are in kW, energies in kWh, prices in €/kWh and the duration
of a time step in hours. A time series has one value per time step of the
optimization horizon, and the first element is the value for the current
time step.

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_TYPES
#define HEMS_TYPES

#include <vector>             // Standard vectors
#include <string>             // Names in error messages
#include <sstream>            // Formatted error messages
#include <stdexcept>          // Standard exceptions

#include "Variables.hpp"         // Optimization variable types
#include "Linear/Variables.hpp"  // Linear name space

namespace HEMS {

namespace Linear = Optimization::Linear;

using Optimization::Dimension;
using TimeSeries = std::vector< double >;

// The default time step is a quarter of an hour, i.e. 96 steps per day.

constexpr double DefaultStepDuration = 0.25;

// All series given for an optimization horizon must have one value per
// time step, and this is checked by a small utility.

inline void CheckLength( const TimeSeries & Series, Dimension Horizon,
                         const std::string & Description )
{
  if ( Series.size() != Horizon )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The " << Description << " has " << Series.size()
                 << " values but the horizon has " << Horizon << " steps";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

}      // End name space HEMS
#endif // HEMS_TYPES
