/*==============================================================================
Tariff

The tariff is the economic model of the household's electricity contract for
a dynamic contract as offered in the Netherlands. The price of imported
energy is the hourly spot price of the day-ahead market plus the procurement
fee of the supplier and the energy tax, and value added tax (VAT) is added to
the sum:

import_price[t] = ( spot[t] + procurement_fee + energy_tax ) * ( 1 + VAT )

The exported energy is paid the spot price plus a sell-back credit from the
supplier. Under net metering the exported energy is instead credited at the
import price, i.e. it is netted against the imported energy.

export_price[t] = spot[t] + sell_back_credit             (no net metering)
export_price[t] = import_price[t]                        (net metering)

The spot price may be negative, and so may the export price.

The fees of some suppliers are provided as presets, and the cost breakdown
computes the itemised cost of a given import and export trajectory.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_TARIFF
#define HEMS_TARIFF

#include <string>                  // Supplier names
#include <map>                     // Supplier presets

#include "Typedefs.hpp"            // HEMS types

namespace HEMS
{

class Tariff
{
public:

  // ---------------------------------------------------------------------------
  // Supplier presets
  // ---------------------------------------------------------------------------

  struct Supplier
  {
    double ProcurementFee;         // €/kWh
    double SellBackCredit;         // €/kWh
  };

  static const std::map< std::string, Supplier > & Suppliers( void );

  // ---------------------------------------------------------------------------
  // Cost breakdown
  // ---------------------------------------------------------------------------
  //
  // The energies are in kWh and all other values in €. The import cost is
  // the sum of the spot cost, the procurement fee and the energy tax plus
  // the VAT of this sum. The export revenue is computed in the same way,
  // where the credit is the sell-back credit or, under net metering, the
  // fee and the tax, and the VAT is only paid back under net metering.

  struct CostBreakdown
  {
    double ImportEnergy, ExportEnergy;
    double SpotImport, Procurement, Tax, ImportVAT, Import;
    double SpotExport, Credit, ExportVAT, Export;

    inline double Net( void ) const
    { return Import - Export; }
  };

  // ---------------------------------------------------------------------------
  // Parameters
  // ---------------------------------------------------------------------------

  TimeSeries SpotPrice;            // €/kWh per time step
  double     ProcurementFee,       // €/kWh
             SellBackCredit,       // €/kWh
             EnergyTax,            // €/kWh
             VAT;                  // Fraction, e.g. 0.21
  bool       NetMetering;

  // ---------------------------------------------------------------------------
  // Prices and costs
  // ---------------------------------------------------------------------------

  double ImportPrice( Dimension t ) const;
  double ExportPrice( Dimension t ) const;

  CostBreakdown Costs( const TimeSeries & Import, const TimeSeries & Export,
                       double StepDuration ) const;

  // The fees of a known supplier replaces the procurement fee and the
  // sell-back credit, and an unknown supplier name is an invalid argument.

  void ApplySupplier( const std::string & Name );

  Tariff( const TimeSeries & Spot = TimeSeries(),
          double Procurement = 0.0, double SellBack = 0.0,
          double Tax = 0.0, double ValueAddedTax = 0.0,
          bool NetMeteringContract = false );
};

}      // End name space HEMS
#endif // HEMS_TARIFF
