/*==============================================================================
Storage state

The storage state is the model of an electrical energy storage shared by the
home battery and the electric vehicle. The energy stored at the start of each
time step is a variable, and there is one more energy value than there are
time steps since the energy at the end of the horizon is also needed. The
energy is bounded by zero and the capacity of the storage.

The power flowing into the storage is the charging power, and the power
flowing out is the discharging power, both non-negative. The energy stored
evolves by the recursion

E[t+1] = E[t] + dt * ( eta_ch * P_ch[t] - P_dis[t] / eta_dis ) - Drain[t]

where the drain is energy leaving the storage without passing through the
household's electrical system, typically the energy used by an electric
vehicle to drive. The efficiencies are the charging and discharging
efficiencies. Charging and discharging in the same time step would allow the
optimizer to waste energy through the losses when the price is negative, and
this is prevented by a binary mode variable for each time step:

P_ch[t]  <= P_ch_max  * Mode[t]
P_dis[t] <= P_dis_max * ( 1 - Mode[t] )

The energy at the start of the horizon equals the given initial energy, and
the energy at the end of the horizon must be at least the terminal energy.
The latter prevents the optimizer from emptying the storage at the end of the
horizon as it does not see the value of the stored energy beyond the horizon.
The net power of the storage is the charging power minus the discharging
power, and it is positive when the storage is charging.

All parameters enter the problem as coefficient functions, and they can be
changed between solutions without changing the structure of the problem.
This is how the initial energy is advanced in a rolling horizon operation.

Author and Copyright: Geir Horn, 2016-2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_STORAGE
#define HEMS_STORAGE

#include <string>                  // Names

#include "Linear.hpp"              // Linear optimization problems
#include "Typedefs.hpp"            // HEMS types
#include "Trajectory.hpp"          // Power trajectory

namespace HEMS
{

class StorageState
{
public:

  // The parameters are grouped so that the devices can define their
  // standard values.

  struct Parameters
  {
    double Capacity;              // E_max  [kWh]
    double MaxCharge;             // P_ch_max  [kW]
    double MaxDischarge;          // P_dis_max [kW]
    double ChargeEfficiency;      // eta_ch
    double DischargeEfficiency;   // eta_dis
    double InitialEnergy;         // E_0 [kWh]
    double TerminalEnergy;        // E_T [kWh]
  };

  const std::string Name;
  const Dimension   Horizon;
  const double      StepDuration;

private:

  Parameters Values;
  TimeSeries Drain;

  // The parameters are checked when they are set, and an invalid value
  // throws an invalid argument exception.

  static void Validate( const Parameters & Candidate, const std::string & Name );

public:

  // The variables are public so that other parts of the household model can
  // use them in expressions, but they cannot be changed.

  const Linear::VariableVector Energy, Charge, Discharge, Mode;
  const PowerTrajectory        NetPower;

  // ---------------------------------------------------------------------------
  // Parameters
  // ---------------------------------------------------------------------------

  inline const Parameters & GetParameters( void ) const
  { return Values; }

  void SetParameters( const Parameters & NewValues );
  void SetInitialEnergy( double Energy );
  void SetTerminalEnergy( double Energy );

  inline const TimeSeries & GetDrain( void ) const
  { return Drain; }

  void SetDrain( const TimeSeries & NewDrain );

  // ---------------------------------------------------------------------------
  // Constraints
  // ---------------------------------------------------------------------------

  Linear::Constraints Constraints( void );

  StorageState( const std::string & TheName, Dimension TheHorizon,
                double TheStepDuration, const Parameters & TheValues );

  StorageState( void ) = delete;
  StorageState( const StorageState & Other ) = delete;
};

}      // End name space HEMS
#endif // HEMS_STORAGE
