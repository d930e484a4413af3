/*=============================================================================
  Resampling

  Implementation of the resampler on top of the GNU Scientific Library.

  Author: Geir Horn, University of Oslo, 2014-2026
  License: GPL (LGPL3.0 without the GNU Scientific Library)
=============================================================================*/

#include <algorithm>               // Clamping the time
#include <cmath>                   // Finite values
#include <iterator>                // Previous element
#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include <gsl/gsl_errno.h>         // GSL status codes
#include <boost/log/trivial.hpp>   // Diagnostic messages

#include "Resampling.hpp"

HEMS::Resampler::Method
HEMS::Resampler::ParseMethod( const std::string & Name )
{
  if ( Name == "hold" )
    return Method::SampleAndHold;
  else if ( Name == "linear" )
    return Method::Linear;
  else if ( Name == "steffen" )
    return Method::Steffen;
  else
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The resampling method \"" << Name << "\" is unknown. "
                 << "It must be \"hold\", \"linear\" or \"steffen\"";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

// -----------------------------------------------------------------------------
// Evaluation
// -----------------------------------------------------------------------------
//
// Times outside of the samples are clamped to the first or last sample, and
// the GSL evaluation can therefore not fail on the domain. A time that is not
// a number cannot be clamped.

double HEMS::Resampler::operator() ( double Time )
{
  if ( !std::isfinite( Time ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Resampling at the time " << Time << " is not possible";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  double x = std::clamp( Time, Abscissa.front(), Abscissa.back() );

  if ( InterpolationObject == nullptr )
  {
    auto Next = std::upper_bound( Abscissa.begin(), Abscissa.end(), x );

    return Ordinate[ std::distance( Abscissa.begin(), std::prev( Next ) ) ];
  }

  double Value;
  int    Status = gsl_interp_eval_e( InterpolationObject, Abscissa.data(),
                                     Ordinate.data(), x, AcceleratorObject,
                                     &Value );

  if ( Status != GSL_SUCCESS )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Interpolation at time " << Time << " failed: "
                 << gsl_strerror( Status );

    throw std::invalid_argument( ErrorMessage.str() );
  }

  return Value;
}

HEMS::TimeSeries HEMS::Resampler::Grid( Dimension Steps, double StepDuration,
                                        double Start )
{
  if ( !( StepDuration > 0.0 ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The step duration must be positive (" << StepDuration
                 << ")";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  TimeSeries Values( Steps );

  for ( Dimension t = 0; t < Steps; t++ )
    Values[ t ] = operator()( Start + t * StepDuration );

  return Values;
}

// -----------------------------------------------------------------------------
// Constructor and destructor
// -----------------------------------------------------------------------------
//
// The default GSL error handler aborts the program, and it is switched off
// so that the returned status codes can be reported as exceptions. This is
// done once for the whole program.

void HEMS::Resampler::ReturnGSLErrors( void )
{
  static gsl_error_handler_t * const DefaultHandler
    = gsl_set_error_handler_off();

  ( void ) DefaultHandler;
}

// The map of samples ensures that the abscissae are unique and sorted as
// required by the GSL. A single sample can only be held.

HEMS::Resampler::Resampler( const ForecastSamples & Samples,
                            Method DesiredMethod )
: Interpolation( DesiredMethod ), Abscissa(), Ordinate(),
  InterpolationObject( nullptr ), AcceleratorObject( nullptr )
{
  if ( Samples.empty() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Resampling requires at least one sample";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  for ( const auto & [ Time, Value ] : Samples )
  {
    if ( !std::isfinite( Time ) || !std::isfinite( Value ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The sample (" << Time << ", " << Value << ") is not "
                   << "a finite number";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    Abscissa.push_back( Time  );
    Ordinate.push_back( Value );
  }

  if ( Interpolation == Method::Steffen &&
       Abscissa.size() < gsl_interp_type_min_size( gsl_interp_steffen ) )
    Interpolation = Method::Linear;

  if ( Interpolation == Method::Linear &&
       Abscissa.size() < gsl_interp_type_min_size( gsl_interp_linear ) )
    Interpolation = Method::SampleAndHold;

  if ( Interpolation != DesiredMethod )
    BOOST_LOG_TRIVIAL( debug ) << "Resampling " << Abscissa.size()
                               << " samples with a simpler method";

  if ( Interpolation == Method::SampleAndHold ) return;

  const gsl_interp_type * GSLType = ( Interpolation == Method::Steffen )
                                    ? gsl_interp_steffen : gsl_interp_linear;

  ReturnGSLErrors();

  AcceleratorObject   = gsl_interp_accel_alloc();
  InterpolationObject = gsl_interp_alloc( GSLType, Abscissa.size() );

  int Status = GSL_ENOMEM;

  if ( AcceleratorObject != nullptr && InterpolationObject != nullptr )
    Status = gsl_interp_init( InterpolationObject, Abscissa.data(),
                              Ordinate.data(), Abscissa.size() );

  if ( Status != GSL_SUCCESS )
  {
    if ( InterpolationObject != nullptr )
      gsl_interp_free( InterpolationObject );

    if ( AcceleratorObject != nullptr )
      gsl_interp_accel_free( AcceleratorObject );

    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Interpolation could not be initialised: "
                 << gsl_strerror( Status );

    throw std::runtime_error( ErrorMessage.str() );
  }
}

HEMS::Resampler::~Resampler( void )
{
  if ( InterpolationObject != nullptr )
    gsl_interp_free( InterpolationObject );

  if ( AcceleratorObject != nullptr )
    gsl_interp_accel_free( AcceleratorObject );
}
