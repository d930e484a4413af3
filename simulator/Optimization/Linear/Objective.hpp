/*==============================================================================
Linear objective

The linear objective interface extends the generic objective with the
function returning the objective as a linear expression of the variables. The
objective function is only called once when the problem is compiled, and the
coefficients of the expression are thereafter re-evaluated before every
solution. The direction of the optimization is defined by the generic
objective and it is read at every solution.

Author and Copyright: Geir Horn, 2018-2026
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR_OBJECTIVE
#define OPTIMIZATION_LINEAR_OBJECTIVE

#include "../Variables.hpp"                   // Basic definitions
#include "../Objective.hpp"                   // Objective function
#include "Linear/Expression.hpp"              // Linear expressions

namespace Optimization::Linear
{

class ObjectiveInterface
: virtual public Optimization::Objective
{
protected:

	virtual Expression ObjectiveFunction( void ) = 0;

	ObjectiveInterface( void )
	: Objective()
	{}

public:

	virtual ~ObjectiveInterface( void )
	{}
};

}      // End name space Optimization::Linear
#endif // OPTIMIZATION_LINEAR_OBJECTIVE
