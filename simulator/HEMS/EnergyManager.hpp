/*==============================================================================
Energy Manager

The energy manager is the optimizer of the household energy flows. It is
given the components of the household: the loads, the solar panels, the
electric vehicles and at most one home battery; and the tariff of the
electricity contract. It then finds the dispatch of the controllable
components over the optimization horizon that is optimal for the chosen
objective.

The household exchanges power with the grid, and at every time step the
power imported minus the power exported must equal the total consumption
minus the total generation:

P_import[t] - P_export[t] = sum loads[t] + sum EVs[t] + battery[t] - sum PV[t]

Both grid powers are non-negative, and importing and exporting in the same
time step is only prevented by the price difference between import and
export, not by a constraint. The energy manager collects the constraints of
all components, and the objective can be one of the following:

Cost:             Minimise dt * sum( import_price * P_import
                                     - export_price * P_export )
Self-consumption: Maximise dt * sum( PV - P_export ), i.e. the solar
                  energy used in the household
Self-reliance:    Minimise dt * sum( P_import ), i.e. the energy taken from
                  the grid

A small penalty per kWh charged to or discharged from the battery is added
to all objectives to avoid needless cycling of the battery when it makes no
difference for the objective.

The problem is compiled once when the energy manager is constructed, and it
is then solved repeatedly as forecasts and prices change. In a rolling
horizon operation the first time step of the solution is applied, the
initial energy of the storage devices is advanced to the energy at the
start of the second time step, and the problem is solved again with updated
forecasts.

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_ENERGY_MANAGER
#define HEMS_ENERGY_MANAGER

#include <memory>                  // Shared pointers
#include <optional>                // Solution and horizon
#include <ostream>                 // Summary output
#include <string>                  // Names
#include <vector>                  // Component lists

#include "Linear.hpp"              // Linear optimization problems
#include "Typedefs.hpp"            // HEMS types
#include "Component.hpp"           // Component interface
#include "Solar.hpp"               // Solar panels
#include "ElectricVehicle.hpp"     // Electric vehicles
#include "Battery.hpp"             // Home battery
#include "Tariff.hpp"              // Economic model

namespace HEMS
{

class EnergyManager : public Linear::Optimizer
{
public:

  // ---------------------------------------------------------------------------
  // Objectives
  // ---------------------------------------------------------------------------

  enum class ObjectiveMode
  {
    Cost,
    SelfConsumption,
    SelfReliance
  };

  // The objectives have names that can be given on the command line

  static ObjectiveMode ParseObjective( const std::string & Name );
  static std::string   ObjectiveName( ObjectiveMode Mode );

  // The penalty on the battery throughput in €/kWh

  static constexpr double CyclePenalty = 0.005;

  // Importing and exporting in the same step is equally good when the two
  // prices are equal, and the export is then penalised by a small amount
  // per kWh so that only the net exchange is used.

  static constexpr double ExchangePenalty = 1e-4;

  // ---------------------------------------------------------------------------
  // Household
  // ---------------------------------------------------------------------------
  //
  // The components are grouped by their role in the power balance. The loads
  // can be any component consuming power, like fixed and flexible loads and
  // heat pumps.

  struct Components
  {
    std::vector< std::shared_ptr< Component > >       Loads;
    std::vector< std::shared_ptr< Solar > >           PVs;
    std::vector< std::shared_ptr< ElectricVehicle > > EVs;
    std::shared_ptr< Battery >                        HomeBattery;
  };

  // ---------------------------------------------------------------------------
  // Solution
  // ---------------------------------------------------------------------------
  //
  // The result of a solution has the status of the solver, the value of the
  // objective function, and the cost breakdown computed from the grid
  // exchange and the tariff. The cost is computed in the same way for all
  // objectives.

  class Result
  {
  public:

    const std::string           Status;
    const double                ObjectiveValue;
    const Tariff::CostBreakdown Costs;
    const TimeSeries            Import, Export;

    Result( const std::string & TheStatus, double TheValue,
            const Tariff::CostBreakdown & TheCosts,
            const TimeSeries & TheImport, const TimeSeries & TheExport )
    : Status( TheStatus ), ObjectiveValue( TheValue ), Costs( TheCosts ),
      Import( TheImport ), Export( TheExport )
    {}

    Result( const Result & Other ) = default;
    Result( void ) = delete;
  };

private:

  const Dimension     Steps;
  const double        StepLength;
  const Components    Household;
  const ObjectiveMode Mode;

  Tariff Prices;

  const Linear::VariableVector GridImport, GridExport;

  std::optional< Result > LastSolution;

  // The components in the order loads, solar panels, electric vehicles
  // and battery. A missing component is an invalid argument.

  static std::vector< std::shared_ptr< Component > >
  AllComponents( const Components & TheComponents );

  // The horizon is given or taken from the first component.

  static Dimension FindHorizon( const Components & TheComponents,
                                std::optional< Dimension > GivenHorizon );

  // All components are checked for consistent horizon and step duration

  void CheckComponents( void ) const;

  // The battery throughput penalty used by all objectives

  Linear::Expression ThroughputPenalty( void ) const;

  // The sum over a set of components of their power values in the last
  // solution.

  template< class ComponentType >
  TimeSeries TotalPower(
    const std::vector< std::shared_ptr< ComponentType > > & Set ) const;

protected:

  // ---------------------------------------------------------------------------
  // Problem definition
  // ---------------------------------------------------------------------------

  virtual Goal Direction( void ) const override;
  virtual Linear::Expression  ObjectiveFunction( void ) override;
  virtual Linear::Constraints ProblemConstraints( void ) override;

public:

  // ---------------------------------------------------------------------------
  // Operations
  // ---------------------------------------------------------------------------
  //
  // Solving the problem for the current parameter values throws if the
  // solver did not find an optimal solution. The step advances the initial
  // energy of the storage devices to the second time step of the last
  // solution.

  Result Solve( const Linear::SolverOptions & Options = Linear::SolverOptions() );
  void   Step( void );

  // The tariff can be replaced between solutions, typically with new spot
  // prices. An empty spot price series is taken as zero prices.

  void SetTariff( const Tariff & NewTariff );

  inline const Tariff & GetTariff( void ) const
  { return Prices; }

  // ---------------------------------------------------------------------------
  // Information
  // ---------------------------------------------------------------------------

  inline Dimension Horizon( void ) const
  { return Steps; }

  inline double StepDuration( void ) const
  { return StepLength; }

  inline ObjectiveMode GetObjective( void ) const
  { return Mode; }

  inline const Components & GetComponents( void ) const
  { return Household; }

  inline const std::optional< Result > & GetSolution( void ) const
  { return LastSolution; }

  // The totals of the last solution

  TimeSeries TotalPVGeneration( void ) const;
  TimeSeries TotalLoad( void ) const;
  TimeSeries TotalEVLoad( void ) const;

  // A readable summary of the last solution

  void Summary( std::ostream & Output ) const;

  // ---------------------------------------------------------------------------
  // Constructor
  // ---------------------------------------------------------------------------

  EnergyManager( const Components & TheComponents,
                 const Tariff & TheTariff = Tariff(),
                 ObjectiveMode TheObjective = ObjectiveMode::Cost,
                 std::optional< Dimension > GivenHorizon = std::nullopt,
                 double TheStepDuration = DefaultStepDuration,
                 const std::string & SolverID = "SCIP" );

  EnergyManager( void ) = delete;
  EnergyManager( const EnergyManager & Other ) = delete;

  virtual ~EnergyManager( void )
  {}
};

}      // End name space HEMS
#endif // HEMS_ENERGY_MANAGER
