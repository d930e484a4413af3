/*==============================================================================
Optimizer

The linear optimizer is the interface between a mixed integer linear problem
defined in terms of linear expressions of variables and the solver of the
Google OR-Tools [1] linear solver wrapper. It compiles the problem once,
creating one solver variable for each problem variable and one solver
constraint row for each problem constraint. Before each solution the problem
is refreshed: all coefficient functions of the objective, the constraints and
the variable bounds are evaluated, and the numerical values are written into
the existing solver objects. The structure of the problem is never changed
after compilation, and the problem can therefore be solved repeatedly with
new parameter values at the cost of a solution only.

The problem is verified structurally when it is compiled: every constraint
must contain at least one variable, and every coefficient must evaluate to a
finite number. A violation of these rules means that the problem cannot be
solved, and it is reported as a logic error.

The solver returns a status code that will by default result in an exception
unless the problem was solved to optimality. However, the action is
controlled by a map where some of the status codes may be mapped to success
and thereby ignored.

The backend solver is selected by its OR-Tools name, and it must support
binary variables. SCIP is the default as it is part of the standard OR-Tools
distribution, but CBC, HiGHS or commercial solvers can be used if the
OR-Tools library was built with them.

References:
[1] Laurent Perron and Vincent Furnon: OR-Tools, Google,
    https://developers.google.com/optimization/

Author and Copyright: Geir Horn, 2018-2026
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR_OPTIMIZER
#define OPTIMIZATION_LINEAR_OPTIMIZER

#include <chrono>                            // Solution time limit
#include <cmath>                             // Checking finite numbers
#include <cstdint>                           // Fixed width integers
#include <map>                               // To ignore some status codes
#include <memory>                            // Smart pointers
#include <optional>                          // For values that may not be set
#include <sstream>                           // Formatted error messages
#include <stdexcept>                         // Standard exceptions
#include <string>                            // Strings
#include <unordered_map>                     // Variable lookup
#include <vector>                            // For variables and values

#include <boost/numeric/conversion/cast.hpp> // Casting numeric types
#include <boost/log/trivial.hpp>             // Diagnostic messages

#include "absl/time/time.h"                  // OR-Tools time limits
#include "ortools/linear_solver/linear_solver.h" // The OR-Tools solvers

#include "../Variables.hpp"                  // Basic definitions
#include "Linear/Variables.hpp"              // Linear variables
#include "Linear/Expression.hpp"             // Linear expressions
#include "Linear/Constraints.hpp"            // Linear constraints
#include "Linear/Objective.hpp"              // Objective function

namespace Optimization::Linear
{
namespace OR = operations_research;

// -----------------------------------------------------------------------------
// Solver options
// -----------------------------------------------------------------------------
//
// The options are forwarded to the solver for each solution. The limits are
// not set unless they are given, in which case the solver's defaults apply.
// If a time limit is given, the solver may stop with a feasible solution that
// is not proven optimal, and this is only accepted if explicitly allowed.

class SolverOptions
{
public:

  std::optional< std::chrono::milliseconds > TimeLimit;
  std::optional< double > RelativeGap, PrimalTolerance;
  bool                    Verbose;
  std::string             SolverParameters;
  bool                    AcceptFeasible;

  SolverOptions( void )
  : TimeLimit(), RelativeGap(), PrimalTolerance(), Verbose( false ),
    SolverParameters(), AcceptFeasible( false )
  {}
};

// -----------------------------------------------------------------------------
// Solution
// -----------------------------------------------------------------------------
//
// The variable values are stored with the variables, and the solution only
// holds the status and the objective value.

class OptimalSolution
{
public:

  const std::string  Status;
  const VariableType ObjectiveValue;
  const bool         ProvenOptimal;

  OptimalSolution( const std::string & TheStatus, VariableType TheValue,
                   bool IsOptimal )
  : Status( TheStatus ), ObjectiveValue( TheValue ), ProvenOptimal( IsOptimal )
  {}

  OptimalSolution( const OptimalSolution & Other ) = default;
  OptimalSolution( void ) = delete;
};

// -----------------------------------------------------------------------------
// Optimizer
// -----------------------------------------------------------------------------

class Optimizer : virtual public ObjectiveInterface
{
public:

  using Status = OR::MPSolver::ResultStatus;

  // The status codes have textual names that can be reported to the user.

  static std::string StatusName( Status TheStatus )
  {
    switch( TheStatus )
    {
      case OR::MPSolver::OPTIMAL:       return "optimal";
      case OR::MPSolver::FEASIBLE:      return "feasible";
      case OR::MPSolver::INFEASIBLE:    return "infeasible";
      case OR::MPSolver::UNBOUNDED:     return "unbounded";
      case OR::MPSolver::ABNORMAL:      return "abnormal";
      case OR::MPSolver::MODEL_INVALID: return "model_invalid";
      case OR::MPSolver::NOT_SOLVED:    return "not_solved";
      default:                          return "unknown";
    }
  }

  // ---------------------------------------------------------------------------
  // Solver failures
  // ---------------------------------------------------------------------------
  //
  // If a status throws, then it should be possible to catch selectively
  // the exception to make the right action. There are several runtime
  // errors, and it is therefore necessary to define derived classes to
  // indicate which error that raised the exception. They are all derived
  // from the solver failure that is a standard runtime error, and one should
  // be able to catch them as a group if needed.

  class SolverFailure : public std::runtime_error
  {
  public:

    const Status ResultStatus;

    SolverFailure( const std::string & ErrorMessage, Status TheStatus )
    : std::runtime_error( ErrorMessage ), ResultStatus( TheStatus )
    {}

    SolverFailure( void ) = delete;
  };

  // There is no assignment of values to the variables that satisfies all
  // constraints.

  class Infeasible : public SolverFailure
  {
  public:

    Infeasible( const std::string & ErrorMessage )
    : SolverFailure( ErrorMessage, OR::MPSolver::INFEASIBLE )
    {}

    Infeasible( void ) = delete;
  };

  // The objective can be improved without limit

  class Unbounded : public SolverFailure
  {
  public:

    Unbounded( const std::string & ErrorMessage )
    : SolverFailure( ErrorMessage, OR::MPSolver::UNBOUNDED )
    {}

    Unbounded( void ) = delete;
  };

  // A limit, typically the time limit, stopped the solver with a feasible
  // solution that is not proven to be optimal.

  class LimitReached : public SolverFailure
  {
  public:

    LimitReached( const std::string & ErrorMessage )
    : SolverFailure( ErrorMessage, OR::MPSolver::FEASIBLE )
    {}

    LimitReached( void ) = delete;
  };

private:

  std::map< Status, Status > StatusAction;

  // ---------------------------------------------------------------------------
  // The compiled problem
  // ---------------------------------------------------------------------------
  //
  // The solver owns the solver variables and constraints, and the pointers
  // to these remain valid as long as the solver exists.

  std::unique_ptr< OR::MPSolver > Solver;

  std::vector< std::pair< VariableReference, OR::MPVariable * > >
  ModelVariables;

  std::unordered_map< const Variable *, OR::MPVariable * > VariableIndex;

  Constraints                       ProblemRows;
  std::vector< OR::MPConstraint * > SolverRows;
  Expression                        ObjectiveExpression;

  bool IsCompiled;

  // Coefficients must be finite numbers and the check is done for all
  // coefficients when they are evaluated.

  inline void CheckFinite( VariableType Value, const std::string & Context )
  {
    if ( !std::isfinite( Value ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The coefficient " << Value << " of " << Context
                   << " is not a finite number";

      throw std::invalid_argument( ErrorMessage.str() );
    }
  }

  // The terms of an expression are collected per solver variable so that
  // the coefficients of a variable occurring several times are added.

  std::unordered_map< const OR::MPVariable *, VariableType >
  Collect( const Expression & TheExpression, const std::string & Context )
  {
    std::unordered_map< const OR::MPVariable *, VariableType > Coefficients;

    for ( const Expression::Term & TheTerm : TheExpression.GetTerms() )
    {
      VariableType Value = TheTerm.Factor();

      CheckFinite( Value, Context );
      Coefficients[ VariableIndex.at( TheTerm.TheVariable.get() ) ] += Value;
    }

    return Coefficients;
  }

  // A problem variable is registered with the solver the first time it is
  // seen in the objective or in a constraint. The bounds are set when the
  // problem is refreshed.

  void Register( const VariableReference & TheVariable,
                 const std::string & Context )
  {
    if ( !TheVariable )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "A term of " << Context << " has no variable";

      throw std::logic_error( ErrorMessage.str() );
    }

    if ( VariableIndex.count( TheVariable.get() ) > 0 ) return;

    OR::MPVariable * SolverVariable = nullptr;
    const double     Unlimited      = OR::MPSolver::infinity();

    switch( TheVariable->Type )
    {
      case Variable::Domain::Continuous:
        SolverVariable = Solver->MakeNumVar( -Unlimited, Unlimited,
                                             TheVariable->Name );
        break;
      case Variable::Domain::Integer:
        SolverVariable = Solver->MakeIntVar( -Unlimited, Unlimited,
                                             TheVariable->Name );
        break;
      case Variable::Domain::Binary:
        SolverVariable = Solver->MakeBoolVar( TheVariable->Name );
        break;
    }

    VariableIndex.emplace( TheVariable.get(), SolverVariable );
    ModelVariables.emplace_back( TheVariable, SolverVariable );
  }

protected:

  // The derived problem defines the constraints, and they are only asked for
  // once when the problem is compiled.

  virtual Constraints ProblemConstraints( void ) = 0;

  // ---------------------------------------------------------------------------
  // Error handling
  // ---------------------------------------------------------------------------
  //
  // Note that the 'at' function is used to retrieve the status record as
  // this will throw if an illegal status is provided.

  inline void IgnoreStatus( Status TheStatus )
  {
    StatusAction.at( TheStatus ) = OR::MPSolver::OPTIMAL;
  }

  inline void ThrowStatus( Status TheStatus )
  {
    StatusAction.at( TheStatus ) = TheStatus;
  }

  // The function to check and throw upon a status different from
  // optimal takes a string describing the execution context.

  void CheckStatus( const Status TheStatus, const std::string & Context,
                    bool AcceptFeasible = false )
  {
    switch( StatusAction.at( TheStatus ) )
    {
      case OR::MPSolver::OPTIMAL:
        break;
      case OR::MPSolver::FEASIBLE:
        if ( AcceptFeasible )
          BOOST_LOG_TRIVIAL( warning ) << "Accepting a feasible solution that "
                                       << "is not proven optimal " << Context;
        else
        {
          std::ostringstream ErrorMessage;

          ErrorMessage << "A limit stopped the solver before the solution "
                       << "was proven optimal " << Context;

          throw LimitReached( ErrorMessage.str() );
        }
        break;
      case OR::MPSolver::INFEASIBLE:
        {
          std::ostringstream ErrorMessage;

          ErrorMessage << "The problem is infeasible " << Context;

          throw Infeasible( ErrorMessage.str() );
        }
        break;
      case OR::MPSolver::UNBOUNDED:
        {
          std::ostringstream ErrorMessage;

          ErrorMessage << "The problem is unbounded " << Context;

          throw Unbounded( ErrorMessage.str() );
        }
        break;
      case OR::MPSolver::ABNORMAL:
      case OR::MPSolver::MODEL_INVALID:
      case OR::MPSolver::NOT_SOLVED:
        {
          std::ostringstream ErrorMessage;

          ErrorMessage << "The solver returned the status "
                       << StatusName( TheStatus ) << " " << Context;

          throw SolverFailure( ErrorMessage.str(), TheStatus );
        }
        break;
      default:
        {
          // This should never be evaluated because the "at" function
          // used to map the status to the status action should throw
          // if the status was unknown.

          std::ostringstream ErrorMessage;

          ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                       << "An unknown solver return status " << TheStatus
                       << " was provided indicating a serious misuse";

          throw std::invalid_argument( ErrorMessage.str() );
        }
    }
  }

  // ---------------------------------------------------------------------------
  // Compiling and refreshing the problem
  // ---------------------------------------------------------------------------
  //
  // The refresh evaluates all coefficients and writes them to the solver.
  // A variable whose bounds are inconsistent makes the problem infeasible,
  // and this is reported already here with the name of the variable.

  void Refresh( void )
  {
    for ( auto & [ TheVariable, SolverVariable ] : ModelVariables )
    {
      VariableType Lower = TheVariable->Lower(),
                   Upper = TheVariable->Upper();

      if ( std::isnan( Lower ) || std::isnan( Upper ) || ( Lower > Upper ) ||
           ( Lower == Infinity ) || ( Upper == -Infinity ) )
      {
        std::ostringstream ErrorMessage;

        ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                     << "The variable " << TheVariable->Name
                     << " has an empty domain [" << Lower << ", " << Upper
                     << "]";

        throw std::invalid_argument( ErrorMessage.str() );
      }

      SolverVariable->SetBounds( Lower, Upper );
    }

    for ( Dimension Row = 0; Row < SolverRows.size(); Row++ )
    {
      const Constraint & TheConstraint = *std::next( ProblemRows.begin(), Row );
      const std::string  Context = "constraint " + TheConstraint.Name;

      CheckFinite( TheConstraint.GetBody().ConstantValue(), Context );

      for ( const auto & [ SolverVariable, Value ] :
            Collect( TheConstraint.GetBody(), Context ) )
        SolverRows[ Row ]->SetCoefficient( SolverVariable, Value );

      auto [ Lower, Upper ] = TheConstraint.Bounds();
      SolverRows[ Row ]->SetBounds( Lower, Upper );
    }

    OR::MPObjective * const TheObjective = Solver->MutableObjective();

    for ( const auto & [ SolverVariable, Value ] :
          Collect( ObjectiveExpression, "the objective function" ) )
      TheObjective->SetCoefficient( SolverVariable, Value );

    VariableType Offset = ObjectiveExpression.ConstantValue();

    CheckFinite( Offset, "the objective function" );
    TheObjective->SetOffset( Offset );

    if ( Direction() == Goal::Maximize )
      TheObjective->SetMaximization();
    else
      TheObjective->SetMinimization();
  }

  // The compilation asks the derived class for the objective function and
  // the constraints, creates the solver variables and the solver rows, and
  // finally refreshes the problem to verify that all coefficients are valid.
  // It must be called once by the constructor of the derived problem class
  // since the virtual functions cannot be called from this constructor.

  void Compile( void )
  {
    if ( IsCompiled )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The problem has already been compiled";

      throw std::logic_error( ErrorMessage.str() );
    }

    ObjectiveExpression = ObjectiveFunction();
    ProblemRows         = ProblemConstraints();

    for ( const Expression::Term & TheTerm : ObjectiveExpression.GetTerms() )
      Register( TheTerm.TheVariable, "the objective function" );

    for ( const Constraint & TheConstraint : ProblemRows )
    {
      if ( !TheConstraint.GetBody().HasVariables() )
      {
        std::ostringstream ErrorMessage;

        ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                     << "The constraint " << TheConstraint.Name
                     << " has no variables and the problem cannot be solved";

        throw std::logic_error( ErrorMessage.str() );
      }

      for ( const Expression::Term & TheTerm : TheConstraint.GetBody().GetTerms() )
        Register( TheTerm.TheVariable, "constraint " + TheConstraint.Name );

      SolverRows.push_back( Solver->MakeRowConstraint(
        -OR::MPSolver::infinity(), OR::MPSolver::infinity(),
        TheConstraint.Name ) );
    }

    IsCompiled = true;

    Refresh();

    BOOST_LOG_TRIVIAL( debug ) << "Compiled a problem with "
                               << ModelVariables.size() << " variables and "
                               << SolverRows.size() << " constraints for the "
                               << Solver->SolverVersion() << " solver";
  }

  // ---------------------------------------------------------------------------
  // Finding a solution
  // ---------------------------------------------------------------------------
  //
  // The solution is found for the current parameter values. The solution
  // values of the variables are stored with the variables if the status
  // check passes.

  OptimalSolution FindSolution( const SolverOptions & Options )
  {
    if ( !IsCompiled )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "Trying to solve the problem before it has been compiled";

      throw std::logic_error( ErrorMessage.str() );
    }

    Refresh();

    for ( auto & ModelVariable : ModelVariables )
      ModelVariable.first->ClearSolution();

    OR::MPSolverParameters Parameters;

    if ( Options.RelativeGap )
      Parameters.SetDoubleParam( OR::MPSolverParameters::RELATIVE_MIP_GAP,
                                 Options.RelativeGap.value() );

    if ( Options.PrimalTolerance )
      Parameters.SetDoubleParam( OR::MPSolverParameters::PRIMAL_TOLERANCE,
                                 Options.PrimalTolerance.value() );

    if ( Options.TimeLimit )
      Solver->SetTimeLimit( absl::Milliseconds(
        boost::numeric_cast< std::int64_t >( Options.TimeLimit->count() ) ) );
    else
      Solver->SetTimeLimit( absl::InfiniteDuration() );

    if ( Options.Verbose )
      Solver->EnableOutput();
    else
      Solver->SuppressOutput();

    if ( !Options.SolverParameters.empty() &&
         !Solver->SetSolverSpecificParametersAsString(
            Options.SolverParameters ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The solver " << Solver->SolverVersion()
                   << " did not accept the parameters \""
                   << Options.SolverParameters << "\"";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    Status Result = Solver->Solve( Parameters );

    CheckStatus( Result, "solving the problem with " +
                 std::to_string( ModelVariables.size() ) + " variables",
                 Options.AcceptFeasible );

    for ( auto & [ TheVariable, SolverVariable ] : ModelVariables )
      TheVariable->StoreSolution( SolverVariable->solution_value() );

    OptimalSolution Solution( StatusName( Result ), Solver->Objective().Value(),
                              Result == OR::MPSolver::OPTIMAL );

    BOOST_LOG_TRIVIAL( info ) << "Solver status " << Solution.Status
                              << " with objective value "
                              << Solution.ObjectiveValue;

    return Solution;
  }

public:

  // ---------------------------------------------------------------------------
  // Problem information
  // ---------------------------------------------------------------------------

  inline bool Compiled( void ) const
  { return IsCompiled; }

  inline Dimension NumberOfVariables( void ) const
  { return ModelVariables.size(); }

  inline Dimension NumberOfConstraints( void ) const
  { return SolverRows.size(); }

  inline std::string SolverName( void ) const
  { return Solver->SolverVersion(); }

  // The largest constraint violation of the last solution

  inline VariableType MaxViolation( void ) const
  { return ProblemRows.MaxViolation(); }

  // ---------------------------------------------------------------------------
  // Constructor and destructor
  // ---------------------------------------------------------------------------
  //
  // The constructor creates the solver, and it is an error if the requested
  // solver is not available in the OR-Tools library.

  Optimizer( const std::string & SolverID )
  : ObjectiveInterface(),
    StatusAction{ { OR::MPSolver::OPTIMAL,       OR::MPSolver::OPTIMAL       },
                  { OR::MPSolver::FEASIBLE,      OR::MPSolver::FEASIBLE      },
                  { OR::MPSolver::INFEASIBLE,    OR::MPSolver::INFEASIBLE    },
                  { OR::MPSolver::UNBOUNDED,     OR::MPSolver::UNBOUNDED     },
                  { OR::MPSolver::ABNORMAL,      OR::MPSolver::ABNORMAL      },
                  { OR::MPSolver::MODEL_INVALID, OR::MPSolver::MODEL_INVALID },
                  { OR::MPSolver::NOT_SOLVED,    OR::MPSolver::NOT_SOLVED    } },
    Solver( OR::MPSolver::CreateSolver( SolverID ) ),
    ModelVariables(), VariableIndex(), ProblemRows(), SolverRows(),
    ObjectiveExpression(), IsCompiled( false )
  {
    if ( !Solver )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The solver " << SolverID << " is not available in "
                   << "the OR-Tools library";

      throw std::logic_error( ErrorMessage.str() );
    }
  }

  Optimizer( void ) = delete;
  Optimizer( const Optimizer & Other ) = delete;

  virtual ~Optimizer( void )
  {}
};

}      // End name space Optimization::Linear
#endif // OPTIMIZATION_LINEAR_OPTIMIZER
