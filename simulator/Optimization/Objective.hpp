/*==============================================================================
Objective function

The abstract objective class defines the direction of the optimization. The
actual form of the objective function depends on the type of problem solved
and is defined by the problem specific objective interfaces. For the linear
problems the objective function is a linear expression of the variables.

Author and Copyright: Geir Horn, 2018-2026
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMMIZATION_OBJECTIVE
#define OPTIMMIZATION_OBJECTIVE

#include "Variables.hpp"

namespace Optimization
{

/*==============================================================================

 Objective function base class

==============================================================================*/

class Objective
{
public:

	// A problem is either minimised or maximised, and a problem offering
	// several objectives may use different directions for them.

	enum class Goal
	{
		Minimize,
		Maximize
	};

protected:

	// The direction is given by the derived problem. It is read every time the
	// problem is refreshed so it may change between two solutions.

	virtual Goal Direction( void ) const = 0;

	// Only the problem classes can construct the objective

	Objective( void )
	{}

public:

	virtual ~Objective( void )
	{}
};

}      // end name space Optimization
#endif // OPTIMMIZATION_OBJECTIVE
