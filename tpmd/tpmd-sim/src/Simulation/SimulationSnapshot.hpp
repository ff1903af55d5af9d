// Ticket: 0005_two_particle_simulation

#ifndef TPMD_SIM_SIMULATION_SNAPSHOT_HPP
#define TPMD_SIM_SIMULATION_SNAPSHOT_HPP

#include <cstdint>

#include "tpmd-sim/src/DataTypes/Coordinate.hpp"
#include "tpmd-sim/src/DataTypes/Velocity.hpp"

namespace tpmd_sim
{

/**
 * @brief Value record of the simulation state at one recorded instant
 *
 * All vectors are copies; a snapshot never aliases live particle state and
 * is not modified after it is appended to the history.
 */
struct SimulationSnapshot
{
  double time{0.0};  // Simulation time [fs]

  Coordinate position1;
  Coordinate position2;
  Velocity velocity1;
  Velocity velocity2;

  double kineticEnergy{0.0};    // [kcal/mol]
  double potentialEnergy{0.0};  // [kcal/mol]
  double totalEnergy{0.0};      // [kcal/mol]

  uint32_t wallCollisions1{0};
  uint32_t wallCollisions2{0};

  /**
   * @brief Inter-particle distance at this instant
   * @return |position1 - position2| [Angstrom]
   */
  [[nodiscard]] double separation() const
  {
    return (position1 - position2).norm();
  }
};

}  // namespace tpmd_sim

#endif  // TPMD_SIM_SIMULATION_SNAPSHOT_HPP
