/*==============================================================================
Battery

The standard parameters of the home battery.

Author and Copyright: Geir Horn, 2016-2026
License: LGPL 3.0
==============================================================================*/

#include "Battery.hpp"

HEMS::StorageState::Parameters
HEMS::Battery::StandardParameters( double Capacity )
{
  StorageState::Parameters Values;

  Values.Capacity            = Capacity;
  Values.MaxCharge           = 5.0;
  Values.MaxDischarge        = 5.0;
  Values.ChargeEfficiency    = 0.95;
  Values.DischargeEfficiency = 0.95;
  Values.InitialEnergy       = Capacity / 2.0;
  Values.TerminalEnergy      = Capacity / 2.0;

  return Values;
}
