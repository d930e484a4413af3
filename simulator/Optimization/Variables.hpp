/*==============================================================================
Variables

A variable in an optimization problem is generally defined over a domain that
can be numeric or non-numeric, and continuous or discrete. The optimization
library provides a homogeneous wrapper for mixed integer linear solvers taking
real variables with double precision, and some of the variables may be
restricted to integer or binary values. Hence, for now, the variable type is
defined to be a standard double. It is important to use the defined variable
type instead of a standard double as its definition could change in the
future.

The linear problems solved are typically re-solved many times with different
data, for instance new price forecasts, while the structure of the problem
remains the same. Numerical values that may change between solutions are
therefore not stored as numbers but as coefficient functions that are
evaluated every time the problem is about to be solved. A coefficient that
never changes is simply a function returning a constant.

Author and Copyright: Geir Horn, 2018-2026
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_VARIABLES
#define OPTIMIZATION_VARIABLES

#include <vector>                             // Variable values
#include <functional>                         // Coefficient functions

namespace Optimization
{
using VariableType   = double;
using Variables      = std::vector< VariableType >;
using Dimension      = typename Variables::size_type;

// A coefficient is a function returning the value of a parameter, and it is
// evaluated when the problem is refreshed before a solve.

using Coefficient    = std::function< VariableType( void ) >;

// There are small utility functions to create coefficients from constants,
// and to negate or scale other coefficients. The values are captured so that
// the returned functions remain valid also if the originals are destroyed.

inline Coefficient Constant( VariableType Value )
{ return [=]( void )->VariableType{ return Value; }; }

inline Coefficient Negate( const Coefficient & Original )
{ return [=]( void )->VariableType{ return -Original(); }; }

inline Coefficient Scale( const Coefficient & Original, VariableType Factor )
{ return [=]( void )->VariableType{ return Factor * Original(); }; }

inline Coefficient Product( const Coefficient & First,
                            const Coefficient & Second )
{ return [=]( void )->VariableType{ return First() * Second(); }; }

}      // End name space Optimization
#endif // OPTIMIZATION_VARIABLES
