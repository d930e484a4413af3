/*==============================================================================
Simple problem

This test creates simple problems showing how to use the linear optimization
interface. The first problem is a small production planning problem:

maximize 3 x[0] + 2 x[1]

subject to

x[0] + x[1]   <= 4
x[0] + 3 x[1] <= 6
x[0] + x[1]   >= Demand  (Parameter dependent constraint)
0 <= x[0], x[1] <= Limit (Parameter dependent bounds)

With Limit = 3 and Demand = 0 the optimum is x = (3,1) with value 11. The
parameters are given as coefficient functions, and the problem is solved
again after changing them without being compiled again.

The second problem is a selection problem with binary variables where only
one of two items can be selected.

Author and Copyright: Geir Horn, 2019-2026
License: LGPL 3.0
==============================================================================*/

#define BOOST_TEST_MODULE SimpleProblem
#include <boost/test/unit_test.hpp>

#include <stdexcept>         // Standard exceptions

#include "Linear.hpp"

namespace Linear = Optimization::Linear;

// -----------------------------------------------------------------------------
// Production planning
// -----------------------------------------------------------------------------

class SimpleProblem : public Linear::Optimizer
{
public:

  double Limit, Demand;

  const Linear::VariableVector x;

protected:

  virtual Goal Direction( void ) const override
  { return Goal::Maximize; }

  virtual Linear::Expression ObjectiveFunction( void ) override
  { return 3.0 * Linear::Expression( x[0] ) + 2.0 * Linear::Expression( x[1] ); }

	virtual Linear::Constraints ProblemConstraints( void ) override
	{
		Linear::Constraints Rows;
		Linear::Expression  Total( x[0] );

		Total.Add( x[1] );

		Rows.Add( Linear::LessEqual( "capacity", Total, 4.0 ) )
		    .Add( Linear::LessEqual( "labour", Linear::Expression( x[0] ) +
		                             Linear::Expression( x[1], 3.0 ), 6.0 ) )
		    .Add( Linear::GreaterEqual( "demand", Total, Linear::Expression(
		          Optimization::Coefficient( [this](){ return Demand; } ) ) ) );

		return Rows;
	}

public:

  inline Linear::OptimalSolution Solve( void )
  { return FindSolution( Linear::SolverOptions() ); }

  SimpleProblem( void )
  : Objective(), ObjectiveInterface(), Optimizer( "SCIP" ),
    Limit( 3.0 ), Demand( 0.0 ),
    x( "x", 2, Linear::Variable::Domain::Continuous,
       Optimization::Constant( 0.0 ), [this](){ return Limit; } )
  {
    Compile();
  }
};

// -----------------------------------------------------------------------------
// Selection with binary variables
// -----------------------------------------------------------------------------

class Selection : public Linear::Optimizer
{
public:

  const Linear::VariableVector Item;

protected:

  virtual Goal Direction( void ) const override
  { return Goal::Maximize; }

  virtual Linear::Expression ObjectiveFunction( void ) override
  { return Linear::Expression( Item[0], 5.0 ) + Linear::Expression( Item[1], 4.0 ); }

  virtual Linear::Constraints ProblemConstraints( void ) override
  {
    Linear::Constraints Rows;

    Rows.Add( Linear::LessEqual( "one item", Linear::Expression( Item[0] ) +
                                 Linear::Expression( Item[1] ), 1.0 ) );

    return Rows;
  }

public:

  inline Linear::OptimalSolution Solve( void )
  { return FindSolution( Linear::SolverOptions() ); }

  Selection( void )
  : Objective(), ObjectiveInterface(), Optimizer( "SCIP" ),
    Item( "item", 2, Linear::Variable::Domain::Binary )
  {
    Compile();
  }
};

// -----------------------------------------------------------------------------
// A problem with a constraint without variables
// -----------------------------------------------------------------------------

class EmptyConstraint : public Linear::Optimizer
{
public:

  const Linear::VariableVector x;

protected:

  virtual Goal Direction( void ) const override
  { return Goal::Minimize; }

  virtual Linear::Expression ObjectiveFunction( void ) override
  { return Linear::Expression( x[0] ); }

  virtual Linear::Constraints ProblemConstraints( void ) override
  {
    Linear::Constraints Rows;

    Rows.Add( Linear::LessEqual( "constant", 1.0, 2.0 ) );

    return Rows;
  }

public:

  EmptyConstraint( void )
  : Objective(), ObjectiveInterface(), Optimizer( "SCIP" ),
    x( "x", 1 )
  {
    Compile();
  }
};

// -----------------------------------------------------------------------------
// Tests
// -----------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE( LinearOptimum )
{
  SimpleProblem Problem;

  BOOST_CHECK_EQUAL( Problem.NumberOfVariables(), 2u );
  BOOST_CHECK_EQUAL( Problem.NumberOfConstraints(), 3u );

  Linear::OptimalSolution Solution = Problem.Solve();

  BOOST_CHECK( Solution.ProvenOptimal );
  BOOST_CHECK_EQUAL( Solution.Status, "optimal" );
  BOOST_CHECK_CLOSE( Solution.ObjectiveValue, 11.0, 1e-4 );
  BOOST_CHECK_CLOSE( Problem.x[0]->Value(), 3.0, 1e-4 );
  BOOST_CHECK_CLOSE( Problem.x[1]->Value(), 1.0, 1e-4 );
  BOOST_CHECK_SMALL( Problem.MaxViolation(), 1e-6 );
}

// Changing the bound re-solves the same compiled problem.

BOOST_AUTO_TEST_CASE( ParameterChange )
{
  SimpleProblem Problem;

  Problem.Solve();
  Problem.Limit = 2.0;

  Linear::OptimalSolution Solution = Problem.Solve();

  BOOST_CHECK_EQUAL( Problem.NumberOfConstraints(), 3u );
  BOOST_CHECK_CLOSE( Problem.x[0]->Value(), 2.0, 1e-4 );
  BOOST_CHECK_CLOSE( Problem.x[1]->Value(), 4.0 / 3.0, 1e-4 );
  BOOST_CHECK_CLOSE( Solution.ObjectiveValue, 6.0 + 8.0 / 3.0, 1e-4 );
}

BOOST_AUTO_TEST_CASE( BinarySelection )
{
  Selection Problem;

  Linear::OptimalSolution Solution = Problem.Solve();

  BOOST_CHECK_CLOSE( Solution.ObjectiveValue, 5.0, 1e-4 );
  BOOST_CHECK_CLOSE( Problem.Item[0]->Value(), 1.0, 1e-4 );
  BOOST_CHECK_SMALL( Problem.Item[1]->Value(), 1e-6 );
}

// An infeasible problem throws and the variables have no values

BOOST_AUTO_TEST_CASE( InfeasibleProblem )
{
  SimpleProblem Problem;

  Problem.Demand = 10.0;

  BOOST_CHECK_THROW( Problem.Solve(), Linear::Optimizer::Infeasible );
  BOOST_CHECK( !Problem.x[0]->Solved() );
  BOOST_CHECK_THROW( Problem.x[0]->Value(), std::logic_error );

  Problem.Demand = 0.0;

  BOOST_CHECK_CLOSE( Problem.Solve().ObjectiveValue, 11.0, 1e-4 );
}

// An empty variable domain is detected before the solver is called

BOOST_AUTO_TEST_CASE( EmptyDomain )
{
  SimpleProblem Problem;

  Problem.Limit = -1.0;

  BOOST_CHECK_THROW( Problem.Solve(), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( StructuralError )
{
  BOOST_CHECK_THROW( EmptyConstraint(), std::logic_error );
}

BOOST_AUTO_TEST_CASE( ExpressionValue )
{
  Linear::VariableVector y( "y", 2 );
  Linear::Expression     Sum( y[0], 2.0 );

  Sum.Add( y[1], -1.0 ).Add( Optimization::Constant( 3.0 ) );

  BOOST_CHECK_CLOSE( Sum.ConstantValue(), 3.0, 1e-9 );
  BOOST_CHECK_THROW( Sum.Value(), std::logic_error );
  BOOST_CHECK_THROW( y[2], std::out_of_range );

  y[0]->StoreSolution( 1.0 );
  y[1]->StoreSolution( 4.0 );

  BOOST_CHECK_CLOSE( Sum.Value(), 1.0, 1e-9 );
  BOOST_CHECK_EQUAL( y[1]->Name, "y[1]" );
}
