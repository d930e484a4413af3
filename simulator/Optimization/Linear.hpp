/*==============================================================================
Linear optimization

This interface uses the linear solver wrapper of Google OR-Tools [1] to solve
mixed integer linear problems. The problem is defined in terms of variables,
linear expressions of the variables, constraints relating two expressions,
and a linear objective function. All numerical values entering the problem
are coefficient functions, and the problem can therefore be compiled once and
solved many times as the parameters change.

The purpose of this C++ interface is to prevent the user from setting up
optimisation problems that will fail on execution, and to keep the problem
definition readable and close to the mathematical formulation. The headers
are included here, so one may include only this file and get all classes.

References:

[1] Laurent Perron and Vincent Furnon: OR-Tools, Google,
    https://developers.google.com/optimization/

Author and Copyright: Geir Horn, 2018-2026
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR
#define OPTIMIZATION_LINEAR

#include "Variables.hpp"                      // Basic definitions
#include "Objective.hpp"                      // Optimization direction
#include "Linear/Variables.hpp"               // Linear variables
#include "Linear/Expression.hpp"              // Linear expressions
#include "Linear/Constraints.hpp"             // Constraint rows
#include "Linear/Objective.hpp"               // Objective function
#include "Linear/Optimizer.hpp"               // Optimizer interface

#endif // OPTIMIZATION_LINEAR
