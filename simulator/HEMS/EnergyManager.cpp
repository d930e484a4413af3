/*==============================================================================
Energy Manager

Implementation of the household problem, its solution and the reporting of
the results. The totals are computed with Armadillo [1] vectors.

References:
[1] Conrad Sanderson and Ryan Curtin: Armadillo: a template-based C++ library
    for linear algebra. Journal of Open Source Software, Vol. 1, pp. 26, 2016.
    http://arma.sourceforge.net/

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#include <algorithm>               // Clamp and max
#include <cmath>                   // Absolute values
#include <iomanip>                 // Formatted output
#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include <armadillo>               // Vector algebra
#include <boost/log/trivial.hpp>   // Diagnostic messages

#include "EnergyManager.hpp"

// -----------------------------------------------------------------------------
// Objectives
// -----------------------------------------------------------------------------

HEMS::EnergyManager::ObjectiveMode
HEMS::EnergyManager::ParseObjective( const std::string & Name )
{
  if ( Name == "cost" )
    return ObjectiveMode::Cost;
  else if ( Name == "self_consumption" )
    return ObjectiveMode::SelfConsumption;
  else if ( Name == "self_reliance" )
    return ObjectiveMode::SelfReliance;
  else
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The objective \"" << Name << "\" is unknown. It must be "
                 << "\"cost\", \"self_consumption\" or \"self_reliance\"";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

std::string HEMS::EnergyManager::ObjectiveName( ObjectiveMode Mode )
{
  switch( Mode )
  {
    case ObjectiveMode::Cost:            return "cost";
    case ObjectiveMode::SelfConsumption: return "self_consumption";
    case ObjectiveMode::SelfReliance:    return "self_reliance";
  }

  return "unknown";
}

Optimization::Objective::Goal HEMS::EnergyManager::Direction( void ) const
{
  if ( Mode == ObjectiveMode::SelfConsumption )
    return Goal::Maximize;
  else
    return Goal::Minimize;
}

// The battery is penalised per kWh of throughput in both directions. This
// is zero if there is no battery.

HEMS::Linear::Expression
HEMS::EnergyManager::ThroughputPenalty( void ) const
{
  Linear::Expression Penalty;

  if ( Household.HomeBattery )
  {
    const StorageState & State = Household.HomeBattery->Storage();
    const double Factor = CyclePenalty * StepLength;

    for ( Dimension t = 0; t < Steps; t++ )
    {
      Penalty.Add( State.Charge[ t ],    Factor );
      Penalty.Add( State.Discharge[ t ], Factor );
    }
  }

  return Penalty;
}

// The prices are read from the tariff every time the problem is refreshed,
// and a new tariff will therefore be used for the next solution.

HEMS::Linear::Expression HEMS::EnergyManager::ObjectiveFunction( void )
{
  Linear::Expression Target;

  switch( Mode )
  {
    case ObjectiveMode::Cost:
      for ( Dimension t = 0; t < Steps; t++ )
      {
        Target.Add( GridImport[ t ], [this,t](){
          return StepLength * Prices.ImportPrice( t ); });
        Target.Add( GridExport[ t ], [this,t](){
          return StepLength *
                 ( ExchangePenalty - Prices.ExportPrice( t ) ); });
      }
      Target += ThroughputPenalty();
      break;
    case ObjectiveMode::SelfConsumption:
      for ( Dimension t = 0; t < Steps; t++ )
      {
        for ( const auto & PV : Household.PVs )
          Target += StepLength * PV->Power()[ t ];

        Target.Add( GridExport[ t ], - StepLength );
      }
      Target -= ThroughputPenalty();
      break;
    case ObjectiveMode::SelfReliance:
      for ( Dimension t = 0; t < Steps; t++ )
      {
        Target.Add( GridImport[ t ], StepLength );
        Target.Add( GridExport[ t ], StepLength * ExchangePenalty );
      }

      Target += ThroughputPenalty();
      break;
  }

  return Target;
}

// -----------------------------------------------------------------------------
// Constraints
// -----------------------------------------------------------------------------
//
// The power balance has the grid exchange on the left hand side and the net
// consumption of the household on the right hand side.

HEMS::Linear::Constraints HEMS::EnergyManager::ProblemConstraints( void )
{
  Linear::Constraints Rows;

  for ( Dimension t = 0; t < Steps; t++ )
  {
    Linear::Expression Grid( GridImport[ t ] ), Demand;

    Grid -= Linear::Expression( GridExport[ t ] );

    for ( const auto & Load : Household.Loads )
      Demand += Load->Power()[ t ];

    for ( const auto & EV : Household.EVs )
      Demand += EV->Power()[ t ];

    if ( Household.HomeBattery )
      Demand += Household.HomeBattery->Power()[ t ];

    for ( const auto & PV : Household.PVs )
      Demand -= PV->Power()[ t ];

    Rows.Add( Linear::Equal( "power_balance[" + std::to_string( t ) + "]",
                             Grid, Demand ) );
  }

  for ( const auto & TheComponent : AllComponents( Household ) )
    Rows.Add( TheComponent->Constraints() );

  return Rows;
}

// -----------------------------------------------------------------------------
// Solving
// -----------------------------------------------------------------------------
//
// The cost breakdown is always computed with the full tariff so that the
// costs of the different objectives can be compared.

HEMS::EnergyManager::Result
HEMS::EnergyManager::Solve( const Linear::SolverOptions & Options )
{
  LastSolution.reset();

  Linear::OptimalSolution Solution = FindSolution( Options );

  TimeSeries Imported( GridImport.Values() ),
             Exported( GridExport.Values() );

  LastSolution.emplace( Solution.Status, Solution.ObjectiveValue,
                        Prices.Costs( Imported, Exported, StepLength ),
                        Imported, Exported );

  BOOST_LOG_TRIVIAL( debug ) << "The household net cost is "
                             << LastSolution->Costs.Net() << " € for the "
                             << ObjectiveName( Mode ) << " objective";

  return LastSolution.value();
}

// The energy at the start of the second time step becomes the initial energy
// of the next solution. It is clamped to the storage limits since the solver
// may return values marginally outside of the bounds.

void HEMS::EnergyManager::Step( void )
{
  if ( !LastSolution )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The energy manager cannot step before the problem has "
                 << "been solved";

    throw std::logic_error( ErrorMessage.str() );
  }

  auto Advance = []( StorageState & State ){
    double Next = State.Energy[ 1 ]->Value();

    State.SetInitialEnergy(
      std::clamp( Next, 0.0, State.GetParameters().Capacity ) );

    BOOST_LOG_TRIVIAL( trace ) << "The initial energy of " << State.Name
                               << " is advanced to "
                               << State.GetParameters().InitialEnergy
                               << " kWh";
  };

  if ( Household.HomeBattery )
    Advance( Household.HomeBattery->Storage() );

  for ( const auto & EV : Household.EVs )
    Advance( EV->Storage() );
}

// -----------------------------------------------------------------------------
// Tariff
// -----------------------------------------------------------------------------

void HEMS::EnergyManager::SetTariff( const Tariff & NewTariff )
{
  Tariff Candidate( NewTariff );

  if ( Candidate.SpotPrice.empty() )
    Candidate.SpotPrice.assign( Steps, 0.0 );

  CheckLength( Candidate.SpotPrice, Steps, "spot price series" );

  Prices = Candidate;
}

// -----------------------------------------------------------------------------
// Totals
// -----------------------------------------------------------------------------
//
// The controllable components only contribute after a solution.

template< class ComponentType >
HEMS::TimeSeries HEMS::EnergyManager::TotalPower(
  const std::vector< std::shared_ptr< ComponentType > > & Set ) const
{
  arma::vec Total( Steps, arma::fill::zeros );

  for ( const auto & TheComponent : Set )
    if ( TheComponent->Power().Solved() )
      Total += arma::vec( TheComponent->Power().Values() );

  return arma::conv_to< TimeSeries >::from( Total );
}

HEMS::TimeSeries HEMS::EnergyManager::TotalPVGeneration( void ) const
{
  return TotalPower( Household.PVs );
}

HEMS::TimeSeries HEMS::EnergyManager::TotalLoad( void ) const
{
  return TotalPower( Household.Loads );
}

HEMS::TimeSeries HEMS::EnergyManager::TotalEVLoad( void ) const
{
  return TotalPower( Household.EVs );
}

// -----------------------------------------------------------------------------
// Summary
// -----------------------------------------------------------------------------

void HEMS::EnergyManager::Summary( std::ostream & Output ) const
{
  if ( !LastSolution )
  {
    Output << "Problem has not been solved yet." << std::endl;
    return;
  }

  const Result & Solution = LastSolution.value();
  const Tariff::CostBreakdown & Costs = Solution.Costs;
  const arma::vec Imported( Solution.Import ), Exported( Solution.Export );

  Output << std::fixed << std::setprecision(1)
         << "HEMS Summary  (objective=" << ObjectiveName( Mode ) << ")\n"
         << "  Status       : " << Solution.Status << "\n"
         << "  Obj. value   : " << std::setprecision(4)
                                << Solution.ObjectiveValue << "\n"
         << std::setprecision(1)
         << "  Grid import  : " << Costs.ImportEnergy << " kWh  (peak "
         << std::setprecision(2) << Imported.max() << " kW)\n"
         << std::setprecision(1)
         << "  Grid export  : " << Costs.ExportEnergy << " kWh  (peak "
         << std::setprecision(2) << Exported.max() << " kW)\n";

  if ( !Household.PVs.empty() )
  {
    double PVEnergy     = StepLength * arma::accu(
                          arma::vec( TotalPVGeneration() ) ),
           SelfConsumed = PVEnergy - Costs.ExportEnergy;

    Output << std::setprecision(1)
           << "  PV generation: " << PVEnergy << " kWh\n"
           << "  Self-consumed: " << SelfConsumed << " kWh  ("
           << 100.0 * SelfConsumed / std::max( PVEnergy, 1e-9 ) << "%)\n";
  }

  auto EnergyRange = [&Output]( const StorageState & State ){
    Output << std::setprecision(1) << "  " << State.Name << " SoC : "
           << State.Energy[ 0 ]->Value() << " -> "
           << State.Energy[ State.Horizon ]->Value() << " kWh\n";
  };

  if ( Household.HomeBattery )
    EnergyRange( Household.HomeBattery->Storage() );

  for ( const auto & EV : Household.EVs )
    EnergyRange( EV->Storage() );

  Output << std::setprecision(4) << "\n"
         << "  --- Cost breakdown (import) ---\n"
         << "  Spot x import : € " << std::setw(7) << Costs.SpotImport << "\n"
         << "  + Procurement : € " << std::setw(7) << Costs.Procurement
         << "  (" << Prices.ProcurementFee << " €/kWh)\n"
         << "  + Energy tax  : € " << std::setw(7) << Costs.Tax
         << "  (" << Prices.EnergyTax << " €/kWh)\n"
         << "  + VAT (" << std::setprecision(0) << 100.0 * Prices.VAT
         << "%)    : € " << std::setprecision(4) << std::setw(7)
         << Costs.ImportVAT << "  (on all above)\n"
         << "  = Import cost : € " << std::setw(7) << Costs.Import << "\n"
         << "  --- Cost breakdown (export) ---\n"
         << "  Spot x export : € " << std::setw(7) << Costs.SpotExport << "\n"
         << "  + Credit      : € " << std::setw(7) << Costs.Credit << "\n";

  if ( Prices.NetMetering )
    Output << "  + VAT         : € " << std::setw(7) << Costs.ExportVAT << "\n";

  Output << "  = Export rev. : € " << std::setw(7) << Costs.Export << "\n"
         << "  Net cost      : € " << std::setw(7) << Costs.Net() << std::endl;
}

// -----------------------------------------------------------------------------
// Components
// -----------------------------------------------------------------------------

std::vector< std::shared_ptr< HEMS::Component > >
HEMS::EnergyManager::AllComponents( const Components & TheComponents )
{
  std::vector< std::shared_ptr< Component > > Collection(
    TheComponents.Loads.begin(), TheComponents.Loads.end() );

  Collection.insert( Collection.end(), TheComponents.PVs.begin(),
                     TheComponents.PVs.end() );
  Collection.insert( Collection.end(), TheComponents.EVs.begin(),
                     TheComponents.EVs.end() );

  if ( TheComponents.HomeBattery )
    Collection.push_back( TheComponents.HomeBattery );

  for ( const auto & TheComponent : Collection )
    if ( !TheComponent )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "A component of the household is not given";

      throw std::invalid_argument( ErrorMessage.str() );
    }

  return Collection;
}

HEMS::Dimension HEMS::EnergyManager::FindHorizon(
  const Components & TheComponents, std::optional< Dimension > GivenHorizon )
{
  std::vector< std::shared_ptr< Component > > Collection
    = AllComponents( TheComponents );

  Dimension TheHorizon = 0;

  if ( GivenHorizon )
    TheHorizon = GivenHorizon.value();
  else if ( !Collection.empty() )
    TheHorizon = Collection.front()->Horizon();
  else
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The horizon cannot be inferred without components";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  if ( TheHorizon == 0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The horizon must have at least one time step";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  return TheHorizon;
}

// A component with a step duration must use the step duration of the
// problem, and all components must have the same horizon.

void HEMS::EnergyManager::CheckComponents( void ) const
{
  if ( !( StepLength > 0.0 ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The step duration must be positive (" << StepLength
                 << ")";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  for ( const auto & TheComponent : AllComponents( Household ) )
  {
    if ( TheComponent->Horizon() != Steps )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The component " << TheComponent->Name() << " has "
                   << TheComponent->Horizon() << " time steps but the "
                   << "horizon has " << Steps << " steps";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    std::optional< double > Duration = TheComponent->StepDuration();

    if ( Duration && std::abs( Duration.value() - StepLength ) > 1e-9 )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The component " << TheComponent->Name() << " has "
                   << "step duration " << Duration.value() << " h but the "
                   << "problem uses " << StepLength << " h";

      throw std::invalid_argument( ErrorMessage.str() );
    }
  }
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
//
// The problem can only be compiled after all members are initialised, and
// it is therefore done at the end of the constructor.

HEMS::EnergyManager::EnergyManager( const Components & TheComponents,
  const Tariff & TheTariff, ObjectiveMode TheObjective,
  std::optional< Dimension > GivenHorizon, double TheStepDuration,
  const std::string & SolverID )
: Optimization::Objective(), Linear::ObjectiveInterface(),
  Linear::Optimizer( SolverID ),
  Steps( FindHorizon( TheComponents, GivenHorizon ) ),
  StepLength( TheStepDuration ), Household( TheComponents ),
  Mode( TheObjective ), Prices(),
  GridImport( "P_import", Steps ), GridExport( "P_export", Steps ),
  LastSolution()
{
  CheckComponents();
  SetTariff( TheTariff );
  Compile();

  BOOST_LOG_TRIVIAL( info ) << "Energy manager for " << ObjectiveName( Mode )
                            << " over " << Steps << " steps of "
                            << StepLength << " h with "
                            << NumberOfVariables() << " variables and "
                            << NumberOfConstraints() << " constraints";
}
