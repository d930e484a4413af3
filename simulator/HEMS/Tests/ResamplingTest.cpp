/*==============================================================================
Resampling test

The forecasts are read from CSV files with the time in hours and the value,
and resampled to the time steps of the optimization horizon. The test writes
small forecast files to the temporary directory and checks the three
resampling methods.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#define BOOST_TEST_MODULE ResamplingTest
#include <boost/test/unit_test.hpp>

#include <cmath>                   // Not a number
#include <exception>               // Parser errors
#include <limits>                  // Infinite values
#include <filesystem>              // Temporary files
#include <fstream>                 // Writing the files
#include <stdexcept>               // Standard exceptions
#include <string>                  // File names

#include "CSVtoTimeSeries.hpp"
#include "Resampling.hpp"

using namespace HEMS;

// A forecast file in the temporary directory that is removed when the test
// case ends.

class ForecastFile
{
public:

  const std::filesystem::path Name;

  ForecastFile( const std::string & FileName, const std::string & Content )
  : Name( std::filesystem::temp_directory_path() / FileName )
  {
    std::ofstream File( Name );
    File << Content;
  }

  ~ForecastFile( void )
  {
    std::error_code Ignored;
    std::filesystem::remove( Name, Ignored );
  }
};

static const ForecastSamples Samples{ { 0.0, 1.0 }, { 1.0, 3.0 }, { 2.0, 5.0 } };

// -----------------------------------------------------------------------------
// Reading
// -----------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE( ReadForecast )
{
  ForecastFile Prices( "HEMS_ReadForecast.csv",
                       "# Hour, price\n0, 0.10\n\n1,\t0.25\n 2 , -0.05\n" );

  ForecastSamples Read = CSVtoTimeSeries( Prices.Name.string() );

  BOOST_CHECK_EQUAL( Read.size(), 3u );
  BOOST_CHECK_CLOSE( Read.at( 1.0 ), 0.25, 1e-9 );
  BOOST_CHECK_CLOSE( Read.at( 2.0 ), -0.05, 1e-9 );
}

BOOST_AUTO_TEST_CASE( InvalidFiles )
{
  ForecastFile Duplicate( "HEMS_Duplicate.csv", "0, 1.0\n1, 2.0\n1, 3.0\n" ),
               Comments( "HEMS_Comments.csv", "# Only a comment\n\n" );

  BOOST_CHECK_THROW( CSVtoTimeSeries( Duplicate.Name.string() ),
                     std::invalid_argument );
  BOOST_CHECK_THROW( CSVtoTimeSeries( Comments.Name.string() ),
                     std::invalid_argument );
  BOOST_CHECK_THROW( CSVtoTimeSeries( "HEMS_NoSuchForecast.csv" ),
                     std::exception );
}

// -----------------------------------------------------------------------------
// Resampling
// -----------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE( SampleAndHold )
{
  Resampler Hold( Samples, Resampler::Method::SampleAndHold );

  BOOST_CHECK_CLOSE( Hold( 0.5 ), 1.0, 1e-9 );
  BOOST_CHECK_CLOSE( Hold( 1.0 ), 3.0, 1e-9 );
  BOOST_CHECK_CLOSE( Hold( 1.99 ), 3.0, 1e-9 );
  BOOST_CHECK_CLOSE( Hold( -1.0 ), 1.0, 1e-9 );
  BOOST_CHECK_CLOSE( Hold( 10.0 ), 5.0, 1e-9 );
}

BOOST_AUTO_TEST_CASE( LinearInterpolation )
{
  Resampler Linear( Samples );

  BOOST_CHECK( Linear.Type() == Resampler::Method::Linear );
  BOOST_CHECK_CLOSE( Linear( 0.5 ), 2.0, 1e-9 );
  BOOST_CHECK_CLOSE( Linear( 1.5 ), 4.0, 1e-9 );
  BOOST_CHECK_CLOSE( Linear( 5.0 ), 5.0, 1e-9 );

  TimeSeries Values = Linear.Grid( 4, 0.5 );

  BOOST_CHECK_EQUAL( Values.size(), 4u );
  BOOST_CHECK_CLOSE( Values[ 1 ], 2.0, 1e-9 );
  BOOST_CHECK_CLOSE( Values[ 3 ], 4.0, 1e-9 );

  // A shifted grid starts at the given time

  BOOST_CHECK_CLOSE( Linear.Grid( 2, 0.5, 1.0 )[ 0 ], 3.0, 1e-9 );
  BOOST_CHECK_THROW( Linear.Grid( 4, 0.0 ), std::invalid_argument );
}

// Steffen's method passes through the samples and does not overshoot for
// monotone data.

BOOST_AUTO_TEST_CASE( SteffenInterpolation )
{
  Resampler Smooth( ForecastSamples{ { 0.0, 0.0 }, { 1.0, 0.0 }, { 2.0, 4.0 },
                                     { 3.0, 4.0 } },
                    Resampler::Method::Steffen );

  BOOST_CHECK( Smooth.Type() == Resampler::Method::Steffen );
  BOOST_CHECK_CLOSE( Smooth( 2.0 ), 4.0, 1e-9 );

  for ( double Time = 0.0; Time <= 3.0; Time += 0.125 )
  {
    BOOST_CHECK( Smooth( Time ) >= -1e-12 );
    BOOST_CHECK( Smooth( Time ) <= 4.0 + 1e-12 );
  }
}

// Too few samples for the requested method gives a simpler method

BOOST_AUTO_TEST_CASE( MethodFallback )
{
  Resampler Two( ForecastSamples{ { 0.0, 1.0 }, { 1.0, 2.0 } },
                 Resampler::Method::Steffen ),
            One( ForecastSamples{ { 0.0, 7.0 } } );

  BOOST_CHECK( Two.Type() == Resampler::Method::Linear );
  BOOST_CHECK_CLOSE( Two( 0.5 ), 1.5, 1e-9 );
  BOOST_CHECK( One.Type() == Resampler::Method::SampleAndHold );
  BOOST_CHECK_CLOSE( One( 3.0 ), 7.0, 1e-9 );

  BOOST_CHECK_THROW( Resampler( ForecastSamples{} ), std::invalid_argument );
}

// Invalid times and samples are reported as exceptions and never reach the
// interpolation library.

BOOST_AUTO_TEST_CASE( InvalidValues )
{
  Resampler Linear( Samples ), Smooth( ForecastSamples{ { 0.0, 0.0 },
    { 1.0, 1.0 }, { 2.0, 4.0 } }, Resampler::Method::Steffen ),
    Hold( Samples, Resampler::Method::SampleAndHold );

  const double Infinite = std::numeric_limits< double >::infinity();

  BOOST_CHECK_THROW( Linear( std::nan("") ), std::invalid_argument );
  BOOST_CHECK_THROW( Linear( Infinite ), std::invalid_argument );
  BOOST_CHECK_THROW( Smooth( -Infinite ), std::invalid_argument );
  BOOST_CHECK_THROW( Hold( std::nan("") ), std::invalid_argument );
  BOOST_CHECK_THROW( Linear.Grid( 2, 0.5, std::nan("") ),
                     std::invalid_argument );

  // Far outside of the samples the end values are held

  BOOST_CHECK_SMALL( Smooth( -1e6 ), 1e-12 );
  BOOST_CHECK_CLOSE( Smooth( 1e6 ), 4.0, 1e-9 );

  BOOST_CHECK_THROW( Resampler( ForecastSamples{ { 0.0, 1.0 },
                                                 { 1.0, std::nan("") } } ),
                     std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( MethodNames )
{
  BOOST_CHECK( Resampler::ParseMethod( "hold" ) ==
               Resampler::Method::SampleAndHold );
  BOOST_CHECK( Resampler::ParseMethod( "steffen" ) ==
               Resampler::Method::Steffen );
  BOOST_CHECK_THROW( Resampler::ParseMethod( "cubic" ), std::invalid_argument );
}
