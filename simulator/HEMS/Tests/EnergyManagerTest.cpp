/*==============================================================================
Energy manager test

The energy manager is tested on small households where the optimal dispatch
is known: a fixed load that must be imported, a flexible load that moves to
the cheapest time step, and solar panels whose surplus is stored in the
battery when the objective is to consume the solar energy in the household.
The validation of the household and the summary of the solution are also
tested.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#define BOOST_TEST_MODULE EnergyManagerTest
#include <boost/test/unit_test.hpp>

#include <memory>                  // Shared pointers
#include <sstream>                 // Summary text
#include <stdexcept>               // Standard exceptions
#include <string>                  // Text search

#include "Load.hpp"
#include "Battery.hpp"
#include "Solar.hpp"
#include "EnergyManager.hpp"

using namespace HEMS;

// -----------------------------------------------------------------------------
// Objectives
// -----------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE( ObjectiveNames )
{
  using Mode = EnergyManager::ObjectiveMode;

  BOOST_CHECK( EnergyManager::ParseObjective( "cost" ) == Mode::Cost );
  BOOST_CHECK( EnergyManager::ParseObjective( "self_consumption" )
               == Mode::SelfConsumption );
  BOOST_CHECK( EnergyManager::ParseObjective( "self_reliance" )
               == Mode::SelfReliance );
  BOOST_CHECK_EQUAL( EnergyManager::ObjectiveName( Mode::SelfReliance ),
                     "self_reliance" );
  BOOST_CHECK_THROW( EnergyManager::ParseObjective( "comfort" ),
                     std::invalid_argument );
}

// -----------------------------------------------------------------------------
// Fixed load
// -----------------------------------------------------------------------------
//
// A load of 1 kW for one hour at 0.10 €/kWh costs 0.10 €.

BOOST_AUTO_TEST_CASE( FixedLoadCost )
{
  auto House = std::make_shared< FixedLoad >( TimeSeries( 4, 1.0 ) );

  EnergyManager::Components Household;
  Household.Loads.push_back( House );

  EnergyManager Manager( Household, Tariff( TimeSeries( 4, 0.10 ) ) );

  BOOST_CHECK( !Manager.GetSolution() );
  BOOST_CHECK_EQUAL( Manager.Horizon(), 4u );
  BOOST_CHECK_CLOSE( Manager.StepDuration(), 0.25, 1e-9 );

  EnergyManager::Result Solution = Manager.Solve();

  BOOST_CHECK_EQUAL( Solution.Status, "optimal" );
  BOOST_CHECK_CLOSE( Solution.ObjectiveValue, 0.10, 1e-4 );
  BOOST_CHECK_CLOSE( Solution.Costs.Net(), 0.10, 1e-4 );
  BOOST_CHECK( Manager.GetSolution().has_value() );

  // Equal import and export prices do not lead to both at the same time

  for ( Dimension t = 0; t < 4; t++ )
  {
    BOOST_CHECK_CLOSE( Solution.Import[ t ], 1.0, 1e-4 );
    BOOST_CHECK_SMALL( Solution.Export[ t ], 1e-6 );
  }

  // A new tariff is used by the next solution

  Manager.SetTariff( Tariff( TimeSeries( 4, 0.20 ) ) );

  BOOST_CHECK_CLOSE( Manager.Solve().Costs.Net(), 0.20, 1e-4 );
  BOOST_CHECK_THROW( Manager.SetTariff( Tariff( TimeSeries( 3, 0.20 ) ) ),
                     std::invalid_argument );
  BOOST_CHECK_CLOSE( Manager.GetTariff().SpotPrice[ 0 ], 0.20, 1e-9 );
}

// With a procurement fee exporting is less valuable than importing, and
// the load is imported without any export.

BOOST_AUTO_TEST_CASE( ImportOnly )
{
  auto House = std::make_shared< FixedLoad >( TimeSeries( 4, 1.0 ) );

  EnergyManager::Components Household;
  Household.Loads.push_back( House );

  EnergyManager Manager( Household, Tariff( TimeSeries( 4, 0.10 ), 0.02 ) );
  EnergyManager::Result Solution = Manager.Solve();

  for ( Dimension t = 0; t < 4; t++ )
  {
    BOOST_CHECK_CLOSE( Solution.Import[ t ], 1.0, 1e-4 );
    BOOST_CHECK_SMALL( Solution.Export[ t ], 1e-6 );
  }

  BOOST_CHECK_CLOSE( Solution.Costs.Procurement, 0.02, 1e-4 );
  BOOST_CHECK_CLOSE( Manager.TotalLoad()[ 2 ], 1.0, 1e-9 );
  BOOST_CHECK_SMALL( Manager.TotalPVGeneration()[ 2 ], 1e-12 );
}

// Without prices and load there is nothing to pay

BOOST_AUTO_TEST_CASE( ZeroCost )
{
  EnergyManager::Components Household;
  Household.Loads.push_back( std::make_shared< FixedLoad >( TimeSeries( 4, 0.0 ) ) );

  EnergyManager Manager( Household );
  EnergyManager::Result Solution = Manager.Solve();

  BOOST_CHECK_SMALL( Solution.ObjectiveValue, 1e-9 );
  BOOST_CHECK_SMALL( Solution.Costs.Net(), 1e-9 );
  BOOST_CHECK_EQUAL( Manager.GetTariff().SpotPrice.size(), 4u );
}

// -----------------------------------------------------------------------------
// Flexible load
// -----------------------------------------------------------------------------
//
// Half a kWh at up to 2 kW takes exactly one quarter of an hour, and the
// cheapest quarter is the second.

BOOST_AUTO_TEST_CASE( FlexibleLoadShifting )
{
  auto Dishwasher = std::make_shared< FlexibleLoad >( 4, 0.25, 2.0, 0.5 );

  EnergyManager::Components Household;
  Household.Loads.push_back( Dishwasher );

  EnergyManager Manager( Household,
                         Tariff( TimeSeries{ 0.3, 0.1, 0.2, 0.4 } ) );
  EnergyManager::Result Solution = Manager.Solve();

  TimeSeries Power( Dishwasher->Power().Values() );

  BOOST_CHECK_CLOSE( Power[ 1 ], 2.0, 1e-4 );
  BOOST_CHECK_SMALL( Power[ 0 ], 1e-6 );
  BOOST_CHECK_SMALL( Power[ 2 ], 1e-6 );
  BOOST_CHECK_SMALL( Power[ 3 ], 1e-6 );
  BOOST_CHECK_CLOSE( Solution.Costs.Net(), 0.05, 1e-4 );

  // More energy than can be consumed is infeasible

  Dishwasher->SetRequiredEnergy( 3.0 );

  BOOST_CHECK_THROW( Manager.Solve(), Linear::Optimizer::Infeasible );
  BOOST_CHECK( !Manager.GetSolution() );
  BOOST_CHECK_THROW( Dishwasher->SetMaxPower( -1.0 ), std::invalid_argument );
}

// -----------------------------------------------------------------------------
// Self-consumption
// -----------------------------------------------------------------------------
//
// The solar surplus at noon is stored in the battery instead of exported.

BOOST_AUTO_TEST_CASE( SelfConsumption )
{
  const Dimension T = 4;

  StorageState::Parameters Values( Battery::StandardParameters( 10.0 ) );
  Values.InitialEnergy  = 5.0;
  Values.TerminalEnergy = 5.0;

  auto House   = std::make_shared< FixedLoad >( TimeSeries( T, 1.0 ) );
  auto Panels  = std::make_shared< Solar >( TimeSeries{ 0.0, 3.0, 3.0, 0.0 } );
  auto Storage = std::make_shared< Battery >( T, 0.25, Values );

  EnergyManager::Components Household;
  Household.Loads.push_back( House );
  Household.PVs.push_back( Panels );
  Household.HomeBattery = Storage;

  EnergyManager Manager( Household, Tariff( TimeSeries( T, 0.1 ) ),
                         EnergyManager::ObjectiveMode::SelfConsumption );

  BOOST_CHECK( Manager.GetObjective()
               == EnergyManager::ObjectiveMode::SelfConsumption );

  EnergyManager::Result Solution = Manager.Solve();

  for ( Dimension t = 0; t < T; t++ )
    BOOST_CHECK_SMALL( Solution.Export[ t ], 1e-6 );

  BOOST_CHECK( Storage->Storage().Charge[ 1 ]->Value() > 1.9 );
  BOOST_CHECK( Storage->Storage().Energy[ T ]->Value() > 5.0 );
  BOOST_CHECK_CLOSE( Manager.TotalPVGeneration()[ 1 ], 3.0, 1e-9 );

  std::ostringstream Text;
  Manager.Summary( Text );

  BOOST_CHECK( Text.str().find( "objective=self_consumption" )
               != std::string::npos );
  BOOST_CHECK( Text.str().find( "Self-consumed" ) != std::string::npos );
  BOOST_CHECK( Text.str().find( "battery SoC" ) != std::string::npos );
}

// -----------------------------------------------------------------------------
// Summary
// -----------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE( Summary )
{
  EnergyManager::Components Household;
  Household.Loads.push_back( std::make_shared< FixedLoad >( TimeSeries( 4, 1.0 ) ) );

  EnergyManager Manager( Household, Tariff( TimeSeries( 4, 0.10 ), 0.02 ) );

  std::ostringstream Unsolved;
  Manager.Summary( Unsolved );

  BOOST_CHECK_EQUAL( Unsolved.str(), "Problem has not been solved yet.\n" );

  Manager.Solve();

  std::ostringstream Solved;
  Manager.Summary( Solved );

  BOOST_CHECK( Solved.str().find( "HEMS Summary  (objective=cost)" )
               != std::string::npos );
  BOOST_CHECK( Solved.str().find( "Net cost" ) != std::string::npos );
  BOOST_CHECK( Solved.str().find( "PV generation" ) == std::string::npos );
}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE( InvalidHousehold )
{
  using Mode = EnergyManager::ObjectiveMode;

  EnergyManager::Components Empty;

  BOOST_CHECK_THROW( EnergyManager( Empty, Tariff() ), std::invalid_argument );
  BOOST_CHECK_THROW( EnergyManager( Empty, Tariff(), Mode::Cost, 0 ),
                     std::invalid_argument );

  EnergyManager::Components Missing;
  Missing.Loads.push_back( nullptr );

  BOOST_CHECK_THROW( EnergyManager( Missing, Tariff() ), std::invalid_argument );

  EnergyManager::Components Mismatch;
  Mismatch.Loads.push_back( std::make_shared< FixedLoad >( TimeSeries( 4, 1.0 ) ) );
  Mismatch.HomeBattery = std::make_shared< Battery >( 5, 0.25 );

  BOOST_CHECK_THROW( EnergyManager( Mismatch, Tariff() ), std::invalid_argument );

  EnergyManager::Components Duration;
  Duration.HomeBattery = std::make_shared< Battery >( 4, 0.5 );

  BOOST_CHECK_THROW( EnergyManager( Duration, Tariff() ), std::invalid_argument );
  BOOST_CHECK_THROW( EnergyManager( Duration, Tariff(), Mode::Cost, 4, 0.0 ),
                     std::invalid_argument );

  EnergyManager::Components Valid;
  Valid.Loads.push_back( std::make_shared< FixedLoad >( TimeSeries( 4, 1.0 ) ) );

  BOOST_CHECK_THROW( EnergyManager( Valid, Tariff( TimeSeries( 3, 0.1 ) ) ),
                     std::invalid_argument );
  BOOST_CHECK_THROW( EnergyManager( Valid, Tariff(), Mode::Cost, 5 ),
                     std::invalid_argument );

  // A horizon can be given when there are no components

  EnergyManager Grid( Empty, Tariff(), Mode::SelfReliance, 4 );

  BOOST_CHECK_EQUAL( Grid.Horizon(), 4u );
  BOOST_CHECK_SMALL( Grid.Solve().ObjectiveValue, 1e-9 );
}
