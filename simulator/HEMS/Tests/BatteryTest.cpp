/*==============================================================================
Battery test

The home battery is tested alone and with a fixed load under the different
objectives. The physical invariants are checked on the solution: the energy
stays within the capacity, the terminal energy is reached, the energy follows
the recursion of the storage, and the battery never charges and discharges in
the same time step, not even when the price is negative and losses would be
profitable.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#define BOOST_TEST_MODULE BatteryTest
#include <boost/test/unit_test.hpp>

#include <memory>                  // Shared pointers
#include <stdexcept>               // Standard exceptions

#include "Battery.hpp"
#include "Load.hpp"
#include "EnergyManager.hpp"

using namespace HEMS;

// A small battery used by most of the tests

static StorageState::Parameters SmallBattery( void )
{
  StorageState::Parameters Values( Battery::StandardParameters( 10.0 ) );

  Values.InitialEnergy  = 5.0;
  Values.TerminalEnergy = 5.0;

  return Values;
}

BOOST_AUTO_TEST_CASE( StandardParameters )
{
  StorageState::Parameters Values( Battery::StandardParameters() );

  BOOST_CHECK_CLOSE( Values.Capacity, 13.5, 1e-9 );
  BOOST_CHECK_CLOSE( Values.MaxCharge, 5.0, 1e-9 );
  BOOST_CHECK_CLOSE( Values.MaxDischarge, 5.0, 1e-9 );
  BOOST_CHECK_CLOSE( Values.ChargeEfficiency, 0.95, 1e-9 );
  BOOST_CHECK_CLOSE( Values.InitialEnergy, 6.75, 1e-9 );
  BOOST_CHECK_CLOSE( Values.TerminalEnergy, 6.75, 1e-9 );
}

BOOST_AUTO_TEST_CASE( InvalidParameters )
{
  StorageState::Parameters Values( SmallBattery() );

  Values.Capacity = -1.0;
  BOOST_CHECK_THROW( Battery( 4, 0.25, Values ), std::invalid_argument );

  Values = SmallBattery();
  Values.ChargeEfficiency = 1.2;
  BOOST_CHECK_THROW( Battery( 4, 0.25, Values ), std::invalid_argument );

  BOOST_CHECK_THROW( Battery( 0, 0.25, SmallBattery() ), std::invalid_argument );
  BOOST_CHECK_THROW( Battery( 4, 0.0, SmallBattery() ), std::invalid_argument );

  Battery Storage( 4, 0.25, SmallBattery() );

  BOOST_CHECK_THROW( Storage.Storage().SetInitialEnergy( -1.0 ),
                     std::invalid_argument );
  BOOST_CHECK_THROW( Storage.Storage().SetDrain( TimeSeries( 3, 0.0 ) ),
                     std::invalid_argument );
}

// With nothing else in the household the battery has no reason to operate,
// and nothing is imported under the self-reliance objective.

BOOST_AUTO_TEST_CASE( IdleBattery )
{
  auto Storage = std::make_shared< Battery >( 4, 0.25, SmallBattery() );

  EnergyManager::Components Household;
  Household.HomeBattery = Storage;

  EnergyManager Manager( Household, Tariff(),
                         EnergyManager::ObjectiveMode::SelfReliance );

  BOOST_CHECK_EQUAL( Manager.Horizon(), 4u );

  EnergyManager::Result Solution = Manager.Solve();

  for ( Dimension t = 0; t < 4; t++ )
  {
    BOOST_CHECK_SMALL( Solution.Import[ t ], 1e-6 );
    BOOST_CHECK_SMALL( Storage->Storage().Charge[ t ]->Value(), 1e-6 );
  }

  BOOST_CHECK_CLOSE( Storage->Storage().Energy[ 4 ]->Value(), 5.0, 1e-4 );
}

// Negative prices make it profitable to import as much as possible, and the
// battery would waste energy by charging and discharging at the same time
// if this was not prevented by the mode variable.

BOOST_AUTO_TEST_CASE( NegativePrices )
{
  const Dimension T  = 8;
  const double    dt = 0.25;

  auto Storage = std::make_shared< Battery >( T, dt, SmallBattery() );
  auto House   = std::make_shared< FixedLoad >( TimeSeries( T, 1.0 ) );

  EnergyManager::Components Household;
  Household.Loads.push_back( House );
  Household.HomeBattery = Storage;

  EnergyManager Manager( Household, Tariff( TimeSeries( T, -0.2 ) ) );
  Manager.Solve();

  const StorageState & State = Storage->Storage();

  BOOST_CHECK_CLOSE( State.Energy[ 0 ]->Value(), 5.0, 1e-4 );
  BOOST_CHECK( State.Energy[ T ]->Value() >= 5.0 - 1e-6 );

  for ( Dimension t = 0; t < T; t++ )
  {
    double Charge    = State.Charge[ t ]->Value(),
           Discharge = State.Discharge[ t ]->Value();

    BOOST_CHECK( Charge < 1e-6 || Discharge < 1e-6 );
    BOOST_CHECK( State.Energy[ t+1 ]->Value() >= -1e-6 );
    BOOST_CHECK( State.Energy[ t+1 ]->Value() <= 10.0 + 1e-6 );

    double Expected = State.Energy[ t ]->Value() +
                      dt * ( 0.95 * Charge - Discharge / 0.95 );

    BOOST_CHECK_SMALL( State.Energy[ t+1 ]->Value() - Expected, 1e-6 );
    BOOST_CHECK_SMALL( Storage->Power().Values()[ t ] - ( Charge - Discharge ),
                       1e-6 );
  }

  BOOST_CHECK_SMALL( Manager.MaxViolation(), 1e-6 );
}

// Cheap energy early and expensive energy late makes the battery charge
// first and discharge later, with full power at the most expensive last
// step. The step moves the initial energy.

BOOST_AUTO_TEST_CASE( ArbitrageAndStep )
{
  const Dimension T = 8;

  auto Storage = std::make_shared< Battery >( T, 0.25, SmallBattery() );
  auto House   = std::make_shared< FixedLoad >( TimeSeries( T, 2.0 ) );

  EnergyManager::Components Household;
  Household.Loads.push_back( House );
  Household.HomeBattery = Storage;

  EnergyManager Manager( Household,
    Tariff( TimeSeries{ 0.05, 0.05, 0.05, 0.05, 0.30, 0.30, 0.30, 0.50 } ) );

  BOOST_CHECK_THROW( Manager.Step(), std::logic_error );

  Manager.Solve();

  const StorageState & State = Storage->Storage();

  BOOST_CHECK( State.Charge[ 0 ]->Value() > 1.0 );
  BOOST_CHECK( State.Discharge[ 7 ]->Value() > 1.0 );

  double Next = State.Energy[ 1 ]->Value();

  Manager.Step();

  BOOST_CHECK_CLOSE( State.GetParameters().InitialEnergy, Next, 1e-9 );

  Manager.Solve();

  BOOST_CHECK_CLOSE( State.Energy[ 0 ]->Value(), Next, 1e-4 );
}
