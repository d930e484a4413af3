/*==============================================================================
Tariff

Implementation of the prices and the cost breakdown. The cost breakdown uses
the Armadillo [1] vectors for the dot products of prices and powers.

References:
[1] Conrad Sanderson and Ryan Curtin: Armadillo: a template-based C++ library
    for linear algebra. Journal of Open Source Software, Vol. 1, pp. 26, 2016.
    http://arma.sourceforge.net/

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#include <sstream>                 // Formatted error messages
#include <stdexcept>               // Standard exceptions

#include <armadillo>               // Vector algebra

#include "Tariff.hpp"

// -----------------------------------------------------------------------------
// Supplier presets
// -----------------------------------------------------------------------------
//
// Dynamic contract fees in the Netherlands as of February 2026.

const std::map< std::string, HEMS::Tariff::Supplier > &
HEMS::Tariff::Suppliers( void )
{
  static const std::map< std::string, Supplier > Presets{
    { "Tibber",        Supplier{ 0.0248, 0.0000 } },
    { "Zonneplan",     Supplier{ 0.0200, 0.0200 } },
    { "Frank Energie", Supplier{ 0.0182, 0.0182 } }
  };

  return Presets;
}

void HEMS::Tariff::ApplySupplier( const std::string & Name )
{
  auto Preset = Suppliers().find( Name );

  if ( Preset == Suppliers().end() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The supplier \"" << Name << "\" is unknown. Known "
                 << "suppliers are:";

    for ( const auto & Known : Suppliers() )
      ErrorMessage << " \"" << Known.first << "\"";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  ProcurementFee = Preset->second.ProcurementFee;
  SellBackCredit = Preset->second.SellBackCredit;
}

// -----------------------------------------------------------------------------
// Prices
// -----------------------------------------------------------------------------

double HEMS::Tariff::ImportPrice( Dimension t ) const
{
  return ( SpotPrice.at( t ) + ProcurementFee + EnergyTax ) * ( 1.0 + VAT );
}

double HEMS::Tariff::ExportPrice( Dimension t ) const
{
  if ( NetMetering )
    return ImportPrice( t );
  else
    return SpotPrice.at( t ) + SellBackCredit;
}

// -----------------------------------------------------------------------------
// Cost breakdown
// -----------------------------------------------------------------------------

HEMS::Tariff::CostBreakdown
HEMS::Tariff::Costs( const TimeSeries & Import, const TimeSeries & Export,
                     double StepDuration ) const
{
  CheckLength( Import, SpotPrice.size(), "import power trajectory" );
  CheckLength( Export, SpotPrice.size(), "export power trajectory" );

  const arma::vec Spot( SpotPrice ), Imported( Import ), Exported( Export );

  CostBreakdown Result;

  Result.ImportEnergy = StepDuration * arma::accu( Imported );
  Result.ExportEnergy = StepDuration * arma::accu( Exported );

  Result.SpotImport  = StepDuration * arma::dot( Spot, Imported );
  Result.Procurement = ProcurementFee * Result.ImportEnergy;
  Result.Tax         = EnergyTax * Result.ImportEnergy;
  Result.ImportVAT   = VAT * ( Result.SpotImport + Result.Procurement +
                               Result.Tax );
  Result.Import      = Result.SpotImport + Result.Procurement + Result.Tax +
                       Result.ImportVAT;

  Result.SpotExport = StepDuration * arma::dot( Spot, Exported );

  if ( NetMetering )
  {
    Result.Credit    = ( ProcurementFee + EnergyTax ) * Result.ExportEnergy;
    Result.ExportVAT = VAT * ( Result.SpotExport + Result.Credit );
  }
  else
  {
    Result.Credit    = SellBackCredit * Result.ExportEnergy;
    Result.ExportVAT = 0.0;
  }

  Result.Export = Result.SpotExport + Result.Credit + Result.ExportVAT;

  return Result;
}

HEMS::Tariff::Tariff( const TimeSeries & Spot, double Procurement,
                      double SellBack, double Tax, double ValueAddedTax,
                      bool NetMeteringContract )
: SpotPrice( Spot ), ProcurementFee( Procurement ), SellBackCredit( SellBack ),
  EnergyTax( Tax ), VAT( ValueAddedTax ), NetMetering( NetMeteringContract )
{
  if ( ValueAddedTax < 0.0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The VAT fraction cannot be negative (" << ValueAddedTax
                 << ")";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}
