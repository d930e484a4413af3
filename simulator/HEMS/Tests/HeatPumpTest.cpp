/*==============================================================================
Heat pump test

The heat pump keeps the building at the set point, and the electrical power
is the thermal power divided by the coefficient of performance. The tests
check the first time step of the simulation for a cold and a warm day, the
limits of the coefficient of performance, and that the heat pump enters the
power balance as a fixed load.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#define BOOST_TEST_MODULE HeatPumpTest
#include <boost/test/unit_test.hpp>

#include <cmath>                   // Not a number
#include <memory>                  // Shared pointers
#include <stdexcept>               // Standard exceptions

#include "HeatPump.hpp"
#include "EnergyManager.hpp"

using namespace HEMS;

BOOST_AUTO_TEST_CASE( CoefficientOfPerformance )
{
  HeatPump Pump( TimeSeries( 4, 0.0 ) );

  BOOST_CHECK_CLOSE( Pump.CoefficientOfPerformance( 0.0 ),
                     0.45 * 308.15 / 35.0, 1e-9 );
  BOOST_CHECK_CLOSE( Pump.CoefficientOfPerformance( 20.0 ), 6.0, 1e-9 );
  BOOST_CHECK_CLOSE( Pump.CoefficientOfPerformance( 40.0 ), 6.0, 1e-9 );
  BOOST_CHECK_CLOSE( Pump.CoefficientOfPerformance( -100.0 ), 1.5, 1e-9 );
}

// At 0°C the heat loss is 4 kW of which 0.7 kW is covered by the internal
// gains, and the indoor temperature stays at the set point.

BOOST_AUTO_TEST_CASE( ColdDay )
{
  HeatPump Pump( TimeSeries( 4, 0.0 ) );

  const double COP = 0.45 * 308.15 / 35.0;

  BOOST_CHECK_CLOSE( Pump.GetThermalPower()[ 0 ], 3.3, 1e-9 );
  BOOST_CHECK_CLOSE( Pump.GetIndoorTemperature()[ 1 ], 20.0, 1e-9 );
  BOOST_CHECK_CLOSE( Pump.GetCOP()[ 0 ], COP, 1e-9 );
  BOOST_CHECK_CLOSE( Pump.Power().Values()[ 0 ], 3.3 / COP, 1e-9 );
  BOOST_CHECK_EQUAL( Pump.GetIndoorTemperature().size(), 5u );
  BOOST_CHECK( Pump.Power().IsFixed() );
}

// Without heat loss the internal gains heat the building above the set
// point and the heat pump is off.

BOOST_AUTO_TEST_CASE( WarmDay )
{
  HeatPump Pump( TimeSeries( 4, 20.0 ) );

  BOOST_CHECK_SMALL( Pump.GetThermalPower()[ 0 ], 1e-12 );
  BOOST_CHECK_SMALL( Pump.Power().Values()[ 0 ], 1e-12 );
  BOOST_CHECK_CLOSE( Pump.GetIndoorTemperature()[ 1 ], 20.021875, 1e-9 );
}

// The thermal power is limited by the size of the heat pump

BOOST_AUTO_TEST_CASE( LimitedPower )
{
  HeatPumpUnit Small;

  Small.MaxThermalPower = 2.0;

  HeatPump Pump( TimeSeries( 4, 0.0 ), 0.25, ThermalBuilding(), Small );

  for ( Dimension t = 0; t < 4; t++ )
    BOOST_CHECK_CLOSE( Pump.GetThermalPower()[ t ], 2.0, 1e-9 );

  BOOST_CHECK( Pump.GetIndoorTemperature()[ 4 ] < 20.0 );
}

BOOST_AUTO_TEST_CASE( NewForecast )
{
  HeatPump Pump( TimeSeries( 4, 20.0 ) );

  Pump.SetAmbientTemperature( TimeSeries( 4, 0.0 ) );

  BOOST_CHECK_CLOSE( Pump.GetThermalPower()[ 0 ], 3.3, 1e-9 );
  BOOST_CHECK_THROW( Pump.SetAmbientTemperature( TimeSeries( 3, 0.0 ) ),
                     std::invalid_argument );
  BOOST_CHECK_THROW( HeatPump( TimeSeries{} ), std::invalid_argument );
  BOOST_CHECK_THROW( HeatPump( TimeSeries( 4, 0.0 ), 0.0 ),
                     std::invalid_argument );
}

// A forecast that cannot be simulated leaves the heat pump as it was

BOOST_AUTO_TEST_CASE( InvalidForecast )
{
  HeatPump Pump( TimeSeries( 4, 0.0 ) );

  const TimeSeries Indoor( Pump.GetIndoorTemperature() ),
                   Thermal( Pump.GetThermalPower() ),
                   Electrical( Pump.Power().Values() );

  TimeSeries Forecast( 4, 10.0 );
  Forecast[ 2 ] = std::nan("");

  BOOST_CHECK_THROW( Pump.SetAmbientTemperature( Forecast ),
                     std::invalid_argument );

  BOOST_CHECK_SMALL( Pump.GetAmbientTemperature()[ 2 ], 1e-12 );

  for ( Dimension t = 0; t < 4; t++ )
  {
    BOOST_CHECK_EQUAL( Pump.GetIndoorTemperature()[ t ], Indoor[ t ] );
    BOOST_CHECK_EQUAL( Pump.GetThermalPower()[ t ], Thermal[ t ] );
    BOOST_CHECK_EQUAL( Pump.Power().Values()[ t ], Electrical[ t ] );
  }

  BOOST_CHECK_EQUAL( Pump.GetIndoorTemperature().size(), 5u );
}

// The electrical power of the heat pump is imported from the grid

BOOST_AUTO_TEST_CASE( GridImport )
{
  auto Pump = std::make_shared< HeatPump >( TimeSeries( 4, 0.0 ) );

  EnergyManager::Components Household;
  Household.Loads.push_back( Pump );

  EnergyManager Manager( Household, Tariff( TimeSeries( 4, 0.10 ), 0.02 ) );
  EnergyManager::Result Solution = Manager.Solve();

  for ( Dimension t = 0; t < 4; t++ )
    BOOST_CHECK_CLOSE( Solution.Import[ t ], Pump->Power().Values()[ t ], 1e-4 );

  BOOST_CHECK_CLOSE( Manager.TotalLoad()[ 0 ], Pump->Power().Values()[ 0 ],
                     1e-9 );
}
