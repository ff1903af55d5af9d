// Ticket: 0005_two_particle_simulation

#ifndef TPMD_SIM_TWO_PARTICLE_SIMULATION_HPP
#define TPMD_SIM_TWO_PARTICLE_SIMULATION_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "tpmd-sim/src/Diagnostics/EnergyTracker.hpp"
#include "tpmd-sim/src/Environment/SimulationBox.hpp"
#include "tpmd-sim/src/Simulation/SimulationSnapshot.hpp"

namespace tpmd_sim
{

class Particle;
class PairPotential;

/// Addresses one of the two particles of a simulation
enum class ParticleSlot : std::size_t
{
  First = 0,
  Second = 1
};

/**
 * @brief Velocity Verlet simulation of two interacting particles in a box
 *
 * Orchestrates one step as:
 * 1. a_old from the forces stored at the end of the previous step
 * 2. Position update for each free particle
 * 3. Elastic wall reflection; a particle's collision counter increases by
 *    one for each step in which it touched at least one wall
 * 4. Pair force at the new positions (F on second = -F on first)
 * 5. a_new, then velocity update with the averaged acceleration
 * 6. time += dt
 *
 * Initial forces are computed at construction so energies are valid before
 * the first step.
 *
 * The particles and the potential are referenced, not owned, and must
 * outlive the simulation. The simulation is the only writer of the
 * particles' state while it exists.
 *
 * @note Not thread-safe. Independent instances may run on separate threads.
 */
class TwoParticleSimulation
{
public:
  /**
   * @brief Configuration for box geometry and timestep
   */
  struct Config
  {
    double boxWidth{20.0};   // [Angstrom]
    double boxHeight{20.0};  // [Angstrom]
    double timestep{0.001};  // [fs]
  };

  /**
   * @brief Construct simulation and compute initial forces
   * @param first First particle (mutated every step)
   * @param second Second particle (mutated every step)
   * @param potential Pair interaction between the particles
   * @param config Box size and timestep
   * @param logger Logger for run progress; spdlog default logger if null
   *
   * @throws std::invalid_argument if timestep is not finite and positive
   * @throws std::invalid_argument if the box extents are invalid
   * @throws std::invalid_argument if first and second are the same object
   */
  TwoParticleSimulation(Particle& first,
                        Particle& second,
                        const PairPotential& potential,
                        const Config& config,
                        std::shared_ptr<spdlog::logger> logger = nullptr);

  ~TwoParticleSimulation() = default;

  // Holds references to external state
  TwoParticleSimulation(const TwoParticleSimulation&) = delete;
  TwoParticleSimulation& operator=(const TwoParticleSimulation&) = delete;
  TwoParticleSimulation(TwoParticleSimulation&&) = delete;
  TwoParticleSimulation& operator=(TwoParticleSimulation&&) = delete;

  /**
   * @brief Advance the system by one timestep
   */
  void step();

  /**
   * @brief Record the current state, then step nSteps times
   *
   * A snapshot is appended after every recordInterval completed steps, so
   * the history grows by 1 + nSteps / recordInterval entries.
   *
   * @param nSteps Number of steps to take (0 records only the current state)
   * @param recordInterval Steps between recorded snapshots
   * @throws std::invalid_argument if nSteps < 0 or recordInterval < 1
   */
  void run(int nSteps, int recordInterval = 1);

  /**
   * @brief Current kinetic, potential and total energy
   *
   * Recomputed from the particle state on every call.
   */
  [[nodiscard]] EnergyTracker::SystemEnergy getEnergies() const;

  [[nodiscard]] double getTime() const;

  [[nodiscard]] double getTimestep() const;

  [[nodiscard]] const SimulationBox& getBox() const;

  [[nodiscard]] const Particle& getParticle(ParticleSlot slot) const;

  /**
   * @brief Number of steps in which the particle touched a wall
   */
  [[nodiscard]] uint32_t getWallCollisionCount(ParticleSlot slot) const;

  /**
   * @brief Snapshots recorded by run(), oldest first
   */
  [[nodiscard]] const std::vector<SimulationSnapshot>& getHistory() const;

private:
  // Pair force from current positions, applied with Newton's third law
  void computeForces();

  void recordSnapshot();

  void logEnergyStatistics() const;

  Particle& particle(ParticleSlot slot);

  std::array<Particle*, 2> particles_;
  const PairPotential& potential_;
  SimulationBox box_;
  double dt_;
  double time_{0.0};

  //! Wall-collision step counts, indexed by ParticleSlot
  std::array<uint32_t, 2> wallCollisions_{0, 0};

  std::vector<SimulationSnapshot> history_;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tpmd_sim

#endif  // TPMD_SIM_TWO_PARTICLE_SIMULATION_HPP
