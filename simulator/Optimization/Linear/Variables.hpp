/*==============================================================================
Linear variables

A linear problem variable is a record keeping the name of the variable, its
domain and the functions giving the lower and the upper bound of the variable.
The bounds are coefficient functions and they are therefore re-evaluated
before each solution of the problem so that a bound may depend on a parameter
that is changed between two solutions, for instance the capacity of a battery.

The variables are shared by the components defining the problem and the
optimizer solving the problem, and the optimizer stores the solution value in
the variable record after a successful solution. A variable vector is just a
convenient way to create and manage a set of variables with common bounds,
typically one variable per time step of the optimization horizon.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR_VARIABLES
#define OPTIMIZATION_LINEAR_VARIABLES

#include <string>                             // Variable names
#include <vector>                             // Variable vectors
#include <memory>                             // Shared pointers
#include <optional>                           // Values after solution
#include <limits>                             // Infinite bounds
#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions

#include "../Variables.hpp"                   // Basic definitions

namespace Optimization::Linear
{
// Variables without a bound in one direction uses the infinity as bound, and
// the solver will understand that the variable is free in that direction.

constexpr VariableType Infinity = std::numeric_limits< VariableType >::infinity();

/*==============================================================================

 Variable

==============================================================================*/

class Variable
{
public:

  // The domain of a variable is continuous unless it is restricted to
  // integer values or binary values.

  enum class Domain
  {
    Continuous,
    Integer,
    Binary
  };

  const std::string Name;
  const Domain      Type;

private:

  Coefficient LowerBound, UpperBound;

  // The solution value is only available after the problem has been solved
  // successfully, and it is cleared before a new solution is attempted.

  std::optional< VariableType > SolutionValue;

public:

  inline VariableType Lower( void ) const
  { return LowerBound(); }

  inline VariableType Upper( void ) const
  { return UpperBound(); }

  inline bool Solved( void ) const
  { return SolutionValue.has_value(); }

  // Reading the value of a variable that has not been solved is an error
  // by the calling code.

  inline VariableType Value( void ) const
  {
    if ( SolutionValue )
      return SolutionValue.value();
    else
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The value of the variable " << Name
                   << " is requested before the problem has been solved";

      throw std::logic_error( ErrorMessage.str() );
    }
  }

  // The optimizer stores and clears the solution values.

  inline void StoreSolution( VariableType TheValue )
  { SolutionValue = TheValue; }

  inline void ClearSolution( void )
  { SolutionValue.reset(); }

  // The constructor takes the name, the type and the bounds. A binary
  // variable is always bounded to the unit interval.

  Variable( const std::string & TheName, Domain TheType,
            const Coefficient & Lower, const Coefficient & Upper )
  : Name( TheName ), Type( TheType ),
    LowerBound( TheType == Domain::Binary ? Constant( 0.0 ) : Lower ),
    UpperBound( TheType == Domain::Binary ? Constant( 1.0 ) : Upper ),
    SolutionValue()
  {}

  Variable( void ) = delete;
  Variable( const Variable & Other ) = delete;
};

// The variables are created and referenced through shared pointers.

using VariableReference = std::shared_ptr< Variable >;

/*==============================================================================

 Variable vector

==============================================================================*/

class VariableVector
{
private:

  std::vector< VariableReference > Elements;

public:

  // Access to the individual variables is range checked, and the standard
  // iterators are provided to allow the vector to be used in range based
  // loops.

  inline const VariableReference & operator[] ( Dimension Index ) const
  {
    if ( Index < Elements.size() )
      return Elements[ Index ];
    else
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "Variable index " << Index << " is outside of the "
                   << "legal range [0," << Elements.size() << ")";

      throw std::out_of_range( ErrorMessage.str() );
    }
  }

  inline Dimension size( void ) const
  { return Elements.size(); }

  inline auto begin( void ) const
  { return Elements.cbegin(); }

  inline auto end( void ) const
  { return Elements.cend(); }

  // The vector is solved if all its elements are solved, and the solution
  // values are returned as a standard vector of values. The latter will throw
  // if one of the variables has not been solved.

  inline bool Solved( void ) const
  {
    for ( const VariableReference & Element : Elements )
      if ( !Element->Solved() ) return false;

    return !Elements.empty();
  }

  inline Variables Values( void ) const
  {
    Variables TheValues;
    TheValues.reserve( Elements.size() );

    for ( const VariableReference & Element : Elements )
      TheValues.push_back( Element->Value() );

    return TheValues;
  }

  // The variables are named by the base name and the index of the element.

  VariableVector( const std::string & BaseName, Dimension Size,
                  Variable::Domain Type = Variable::Domain::Continuous,
                  const Coefficient & Lower = Constant( 0.0 ),
                  const Coefficient & Upper = Constant( Infinity ) )
  : Elements()
  {
    Elements.reserve( Size );

    for ( Dimension i = 0; i < Size; i++ )
      Elements.emplace_back( std::make_shared< Variable >(
        BaseName + "[" + std::to_string( i ) + "]", Type, Lower, Upper ) );
  }

  VariableVector( void ) = delete;
};

}      // End name space Optimization::Linear
#endif // OPTIMIZATION_LINEAR_VARIABLES
