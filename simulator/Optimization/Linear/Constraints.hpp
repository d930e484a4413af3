/*==============================================================================
Linear constraints

Constraints are the most important aspect of any optimisation problem since
inequality constraints confine the search space and equality constraints
reduce the problem dimension.

A linear constraint relates two linear expressions by less-or-equal, equality
or greater-or-equal. Internally the constraint is stored as the difference
between the left and the right hand side expressions compared with zero.
When the constraint is given to the solver the constant part of this
difference is moved to the right hand side and becomes the bound of the
constraint row. Since the constant part is made of coefficient functions, the
bounds follow the parameters of the problem, and this is how for instance the
initial state of charge of a battery enters the problem without changing its
structure.

The constraints class is a container of constraints and it is used by
components to return the set of constraints they contribute to a problem.

Author and Copyright: Geir Horn, 2018-2026
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR_CONSTRAINTS
#define OPTIMIZATION_LINEAR_CONSTRAINTS

#include <string>                             // Constraint names
#include <vector>                             // Constraint sets
#include <algorithm>                          // Min and max
#include <cmath>                              // Absolute values
#include <utility>                            // Pairs

#include "../Variables.hpp"                   // Basic definitions
#include "Linear/Variables.hpp"               // Infinity
#include "Linear/Expression.hpp"              // Linear expressions

namespace Optimization::Linear
{
/*==============================================================================

 Constraint

==============================================================================*/

class Constraint
{
public:

  enum class Relation
  {
    LessEqual,
    Equal,
    GreaterEqual
  };

  std::string Name;
  Relation    Type;

private:

  // The body is the left hand side minus the right hand side.

  Expression Body;

public:

  inline const Expression & GetBody( void ) const
  { return Body; }

  // The bounds of the constraint row are computed from the constant part of
  // the body for the current parameter values. The pair returned is the lower
  // and upper bound for the sum of the variable terms.

  inline std::pair< VariableType, VariableType > Bounds( void ) const
  {
    VariableType Bound = - Body.ConstantValue();

    switch ( Type )
    {
      case Relation::LessEqual:
        return { -Infinity, Bound };
      case Relation::GreaterEqual:
        return { Bound, Infinity };
      default:
        return { Bound, Bound };
    }
  }

  // The violation is zero if the constraint holds for the solution values of
  // the variables and otherwise the amount by which it is violated.

  inline VariableType Violation( void ) const
  {
    VariableType Slack = Body.Value();

    switch ( Type )
    {
      case Relation::LessEqual:
        return std::max( Slack, 0.0 );
      case Relation::GreaterEqual:
        return std::max( -Slack, 0.0 );
      default:
        return std::abs( Slack );
    }
  }

  Constraint( const std::string & TheName, const Expression & Left,
              Relation TheType, const Expression & Right )
  : Name( TheName ), Type( TheType ), Body( Left - Right )
  {}

  Constraint( void ) = delete;
};

// There are helper functions to make the definition of constraints read
// like the mathematical relation.

inline Constraint LessEqual( const std::string & Name,
                             const Expression & Left, const Expression & Right )
{ return Constraint( Name, Left, Constraint::Relation::LessEqual, Right ); }

inline Constraint Equal( const std::string & Name,
                         const Expression & Left, const Expression & Right )
{ return Constraint( Name, Left, Constraint::Relation::Equal, Right ); }

inline Constraint GreaterEqual( const std::string & Name,
                                const Expression & Left,
                                const Expression & Right )
{ return Constraint( Name, Left, Constraint::Relation::GreaterEqual, Right ); }

/*==============================================================================

 Constraints

==============================================================================*/
//
// The set of constraints is a vector of constraints that can be extended by
// single constraints or by other sets of constraints.

class Constraints
{
private:

  std::vector< Constraint > ConstraintRows;

public:

  inline Constraints & Add( const Constraint & NewConstraint )
  {
    ConstraintRows.push_back( NewConstraint );
    return *this;
  }

  inline Constraints & Add( const Constraints & Other )
  {
    ConstraintRows.insert( ConstraintRows.end(), Other.ConstraintRows.begin(),
                           Other.ConstraintRows.end() );
    return *this;
  }

  inline Dimension NumberOfConstraints( void ) const
  { return ConstraintRows.size(); }

  inline bool empty( void ) const
  { return ConstraintRows.empty(); }

  inline auto begin( void ) const
  { return ConstraintRows.cbegin(); }

  inline auto end( void ) const
  { return ConstraintRows.cend(); }

  // The largest violation over all constraints is useful to check that a
  // solution is feasible.

  inline VariableType MaxViolation( void ) const
  {
    VariableType Largest = 0.0;

    for ( const Constraint & Row : ConstraintRows )
      Largest = std::max( Largest, Row.Violation() );

    return Largest;
  }

  Constraints( void ) : ConstraintRows()
  {}
};

}      // End name space Optimization::Linear
#endif // OPTIMIZATION_LINEAR_CONSTRAINTS
