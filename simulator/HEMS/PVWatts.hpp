/*==============================================================================
PVWatts

The maximum power available from the solar panels is computed by the simple
PVWatts model [1] from the irradiance on the plane of the panels, the air
temperature and the wind speed. The cell temperature is estimated by the
Sandia Array Performance Model [2] for an open rack glass/glass module, and
the DC power is the nameplate power scaled by the irradiance relative to
1000 W/m² and corrected for the cell temperature. The AC power is computed
by the PVWatts inverter model and limited by the AC rating of the inverter.

The transposition of the global irradiance onto the plane of the panels
depends on the position of the sun and is not done here, and the
plane-of-array irradiance must be given.

References:
[1] A. P. Dobos: "PVWatts Version 5 Manual", National Renewable Energy
    Laboratory, NREL/TP-6A20-62641, 2014
[2] D. L. King, W. E. Boyson and J. A. Kratochvil: "Photovoltaic Array
    Performance Model", Sandia National Laboratories, SAND2004-3535, 2004

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_PVWATTS
#define HEMS_PVWATTS

#include <optional>                // Optional AC rating

#include "Typedefs.hpp"            // HEMS types

namespace HEMS
{

class PVWatts
{
public:

  const double DCCapacity,             // pdc0 [kW]
               ACCapacity,             // pac0 [kW]
               TemperatureCoefficient, // gamma [1/°C]
               InverterEfficiency;     // Nominal efficiency

  // The cell temperature for a given plane-of-array irradiance [W/m²],
  // air temperature [°C] and wind speed [m/s]

  static double CellTemperature( double Irradiance, double AirTemperature,
                                 double WindSpeed );

  // The power conversion functions, both returning kW

  double DCPower( double Irradiance, double CellTemperature ) const;
  double ACPower( double DCPower ) const;

  // The series of maximum AC power for the given weather forecast where all
  // series must have the same length.

  TimeSeries MaximumPower( const TimeSeries & Irradiance,
                           const TimeSeries & AirTemperature,
                           const TimeSeries & WindSpeed ) const;

  // The AC rating of the inverter equals the DC rating unless given.

  PVWatts( double NameplatePower = 5.0,
           double PowerTemperatureCoefficient = -0.004,
           double NominalInverterEfficiency = 0.96,
           std::optional< double > InverterRating = std::nullopt );
};

}      // End name space HEMS
#endif // HEMS_PVWATTS
