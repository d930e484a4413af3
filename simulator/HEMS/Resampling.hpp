/*=============================================================================
  Resampling

  The forecasts of prices, solar power, temperature and load are rarely given
  on the time grid of the optimization. The resampler takes the samples of a
  forecast, as read from a file, and computes the value of the forecast at
  the start of every time step of the horizon. It is fundamentally only an
  interface to the interpolation algorithms of the GNU Scientific Library
  [1].

  ALGORITHM:

  Three methods are supported. The sample-and-hold method keeps the value of
  the last sample at or before the requested time, and it is the right
  choice for prices that are constant over the market period. Linear
  interpolation fits a straight line between two neighbouring samples.
  Steffen's method [2] fits cubic polynomials while guaranteeing
  monotonicity between the samples, and it will therefore not overshoot for
  physical quantities like the solar power that must stay non-negative.

  The horizon may extend beyond the samples, and the forecast is then held
  at the first or the last sample value. The GSL methods need a minimum
  number of samples, and the resampler falls back to a simpler method for
  short forecasts.

  REFERENCES:

  [1] https://www.gnu.org/software/gsl/
  [2] M. Steffen: "A Simple Method for Monotonic Interpolation in One
      Dimension", Astronomy & Astrophysics, Vol. 239, No. 1-2, pp. 443-450,
      November 1990

  Author: Geir Horn, University of Oslo, 2014-2026
  License: GPL (LGPL3.0 without the GNU Scientific Library)
=============================================================================*/

#ifndef HEMS_RESAMPLING
#define HEMS_RESAMPLING

#include <vector>                  // Sample values
#include <string>                  // Method names

#include <gsl/gsl_interp.h>        // GSL interpolation

#include "Typedefs.hpp"            // HEMS types
#include "CSVtoTimeSeries.hpp"     // Forecast samples

namespace HEMS
{

class Resampler
{
public:

  enum class Method
  {
    SampleAndHold,
    Linear,
    Steffen
  };

  static Method ParseMethod( const std::string & Name );

private:

  Method Interpolation;

  // The GSL needs the sample values stored in vectors

  std::vector< double > Abscissa, Ordinate;

  // The GSL needs an accelerator object holding the state of searches and an
  // interpolation object holding the coefficients computed from the data.
  // Both are allocated by the constructor and deleted by the destructor.

  gsl_interp       * InterpolationObject;
  gsl_interp_accel * AcceleratorObject;

  // The GSL errors are returned as status codes and not handled by the
  // default GSL handler

  static void ReturnGSLErrors( void );

public:

  inline Method Type( void ) const
  { return Interpolation; }

  // The value of the forecast at a given time in hours

  double operator() ( double Time );

  // The values at the start of each time step of the horizon, where the
  // first step starts at the given time offset.

  TimeSeries Grid( Dimension Steps, double StepDuration, double Start = 0.0 );

  Resampler( const ForecastSamples & Samples,
             Method DesiredMethod = Method::Linear );

  Resampler( void ) = delete;
  Resampler( const Resampler & Other ) = delete;

  ~Resampler( void );
};

}      // End name space HEMS
#endif // HEMS_RESAMPLING
