/*==============================================================================
Heat pump

The air source heat pump is modelled as a fixed load whose electrical power
is computed by a simulation of the building before the optimization. The
building is a single thermal node with capacity C [kWh/°C] losing heat to the
ambient air through the heat loss coefficient H [kW/°C], and the indoor
temperature evolves as

C dT_in/dt = H ( T_amb - T_in ) + Q_hp + Q_int

where Q_hp is the thermal power of the heat pump and Q_int is the heat gain
from occupants and appliances. At every time step the heat pump delivers the
thermal power needed to bring the indoor temperature back to the set point,
limited to its maximum thermal output, and it is never cooling. The
simulation uses forward Euler integration over the time steps.

The coefficient of performance (COP) is the Carnot efficiency for the supply
temperature and the ambient temperature scaled by a second law efficiency,
and it is clamped to a realistic interval. The temperature difference used
in the Carnot efficiency is at least one degree to avoid the singularity
when the ambient temperature approaches the supply temperature. The
electrical power is the thermal power divided by the COP.

The heat pump has no decision variables and contributes no constraints, but
the indoor temperature, the thermal power and the COP are kept so that they
can be inspected. A new ambient temperature forecast re-runs the simulation
and updates the electrical power profile.

Author and Copyright: Geir Horn, 2026
License: LGPL 3.0
==============================================================================*/

#ifndef HEMS_HEAT_PUMP
#define HEMS_HEAT_PUMP

#include <string>                  // Names
#include <optional>                // Step duration

#include "Linear.hpp"              // Linear optimization problems
#include "Typedefs.hpp"            // HEMS types
#include "Trajectory.hpp"          // Power trajectory
#include "Component.hpp"           // Component interface

namespace HEMS
{

// The building parameters and the heat pump parameters have standard values
// for a typical Dutch dwelling.

struct ThermalBuilding
{
  double HeatLoss           = 0.20;    // H [kW/°C]
  double Capacity           = 8.0;     // C [kWh/°C]
  double SetPoint           = 20.0;    // T_set [°C]
  double InitialTemperature = 20.0;    // T_in_0 [°C]
  double InternalGains      = 0.7;     // Q_int [kW]
};

struct HeatPumpUnit
{
  double SupplyTemperature = 35.0;     // T_supply [°C]
  double CarnotEfficiency  = 0.45;     // Second law efficiency
  double MinCOP            = 1.5;
  double MaxCOP            = 6.0;
  double MaxThermalPower   = 8.0;      // P_hp_max [kW]
};

class HeatPump : public Component
{
public:

  using Building = ThermalBuilding;
  using Unit     = HeatPumpUnit;

  const Building House;
  const Unit     Pump;
  const double   StepLength;

private:

  TimeSeries AmbientTemperature, IndoorTemperature, ThermalPower, COP;

  PowerTrajectory Electrical;

  // The simulation computes all trajectories for a given ambient forecast
  // without changing the heat pump, and they are stored by the commit that
  // returns the electrical power.

  struct Trajectories
  {
    TimeSeries Indoor, Thermal, Performance, Electrical;
  };

  Trajectories Simulate( const TimeSeries & Ambient ) const;
  TimeSeries   Commit( Trajectories && Result );

public:

  double CoefficientOfPerformance( double Ambient ) const;

  // Replacing the ambient forecast re-runs the simulation. The heat pump is
  // unchanged if the new forecast is invalid.

  void SetAmbientTemperature( const TimeSeries & Forecast );

  inline const TimeSeries & GetAmbientTemperature( void ) const
  { return AmbientTemperature; }

  inline const TimeSeries & GetIndoorTemperature( void ) const
  { return IndoorTemperature; }

  inline const TimeSeries & GetThermalPower( void ) const
  { return ThermalPower; }

  inline const TimeSeries & GetCOP( void ) const
  { return COP; }

  virtual const PowerTrajectory & Power( void ) const override
  { return Electrical; }

  virtual std::optional< double > StepDuration( void ) const override
  { return StepLength; }

  virtual Linear::Constraints Constraints( void ) override
  { return Linear::Constraints(); }

  HeatPump( const TimeSeries & Ambient,
            double StepDuration = DefaultStepDuration,
            const Building & TheHouse = Building(),
            const Unit & ThePump = Unit(),
            const std::string & Name = "heat pump" );

  HeatPump( void ) = delete;

  virtual ~HeatPump( void )
  {}
};

}      // End name space HEMS
#endif // HEMS_HEAT_PUMP
