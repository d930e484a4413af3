/*==============================================================================
Linear expression

A linear expression is a sum of terms, each term being a variable multiplied
with a coefficient, plus a constant part that may also depend on parameters.
Both the objective function and the constraints of a linear problem are linear
expressions, and the expressions are built once when the problem is defined.
The numerical values of the coefficients are only obtained when the problem is
refreshed before a solution, and so the same expression can be used for many
solutions with different parameter values.

The same variable may occur in several terms of the same expression, and the
coefficients are then added when the expression is given to the solver.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR_EXPRESSION
#define OPTIMIZATION_LINEAR_EXPRESSION

#include <vector>                             // Terms and constants

#include "../Variables.hpp"                   // Basic definitions
#include "Linear/Variables.hpp"               // Linear variables

namespace Optimization::Linear
{

class Expression
{
public:

  // A term is just the pair of a variable and its coefficient

  struct Term
  {
    VariableReference TheVariable;
    Coefficient       Factor;
  };

private:

  std::vector< Term >        Terms;
  std::vector< Coefficient > Constants;

public:

  // ---------------------------------------------------------------------------
  // Building the expression
  // ---------------------------------------------------------------------------
  //
  // Terms can be added with a coefficient function or with a constant factor,
  // and the add functions returns the expression so that the calls can be
  // chained.

  inline Expression & Add( const VariableReference & X,
                           const Coefficient & Factor )
  {
    Terms.push_back( Term{ X, Factor } );
    return *this;
  }

  inline Expression & Add( const VariableReference & X,
                           VariableType Factor = 1.0 )
  { return Add( X, Constant( Factor ) ); }

  inline Expression & Add( const Coefficient & Value )
  {
    Constants.push_back( Value );
    return *this;
  }

  // Expressions can be added and subtracted. The subtraction negates the
  // coefficients of the other expression.

  inline Expression & operator += ( const Expression & Other )
  {
    Terms.insert( Terms.end(), Other.Terms.begin(), Other.Terms.end() );
    Constants.insert( Constants.end(), Other.Constants.begin(),
                      Other.Constants.end() );
    return *this;
  }

  inline Expression & operator -= ( const Expression & Other )
  {
    for ( const Term & OtherTerm : Other.Terms )
      Terms.push_back( Term{ OtherTerm.TheVariable,
                             Negate( OtherTerm.Factor ) } );

    for ( const Coefficient & Value : Other.Constants )
      Constants.push_back( Negate( Value ) );

    return *this;
  }

  // Scaling the expression by a constant factor scales all the terms and
  // the constants.

  inline Expression & operator *= ( VariableType Factor )
  {
    for ( Term & TheTerm : Terms )
      TheTerm.Factor = Scale( TheTerm.Factor, Factor );

    for ( Coefficient & Value : Constants )
      Value = Scale( Value, Factor );

    return *this;
  }

  // ---------------------------------------------------------------------------
  // Evaluation
  // ---------------------------------------------------------------------------
  //
  // The terms are needed by the optimizer when the expression is given to
  // the solver.

  inline const std::vector< Term > & GetTerms( void ) const
  { return Terms; }

  inline bool HasVariables( void ) const
  { return !Terms.empty(); }

  // The constant part is the sum of the constant coefficients for the
  // current parameter values.

  inline VariableType ConstantValue( void ) const
  {
    VariableType Sum = 0.0;

    for ( const Coefficient & Value : Constants )
      Sum += Value();

    return Sum;
  }

  // The value of the full expression can only be computed once all the
  // variables have solution values, and the variable value function will
  // throw if this is not the case.

  inline VariableType Value( void ) const
  {
    VariableType Sum = ConstantValue();

    for ( const Term & TheTerm : Terms )
      Sum += TheTerm.Factor() * TheTerm.TheVariable->Value();

    return Sum;
  }

  // ---------------------------------------------------------------------------
  // Constructors
  // ---------------------------------------------------------------------------

  Expression( void )
  : Terms(), Constants()
  {}

  Expression( const VariableReference & X, VariableType Factor = 1.0 )
  : Expression()
  { Add( X, Factor ); }

  Expression( const VariableReference & X, const Coefficient & Factor )
  : Expression()
  { Add( X, Factor ); }

  Expression( const Coefficient & Value )
  : Expression()
  { Add( Value ); }

  Expression( VariableType Value )
  : Expression()
  { Add( Constant( Value ) ); }

  Expression( const Expression & Other ) = default;
  Expression & operator = ( const Expression & Other ) = default;
};

// The binary operators are defined in terms of the compound assignments

inline Expression operator + ( Expression Left, const Expression & Right )
{ return Left += Right; }

inline Expression operator - ( Expression Left, const Expression & Right )
{ return Left -= Right; }

inline Expression operator * ( VariableType Factor, Expression Right )
{ return Right *= Factor; }

}      // End name space Optimization::Linear
#endif // OPTIMIZATION_LINEAR_EXPRESSION
