// Ticket: 0006_energy_drift_diagnostics

#ifndef TPMD_SIM_DIAGNOSTICS_ENERGY_TRACKER_HPP
#define TPMD_SIM_DIAGNOSTICS_ENERGY_TRACKER_HPP

#include <optional>
#include <span>

#include "tpmd-sim/src/Simulation/SimulationSnapshot.hpp"

namespace tpmd_sim
{

// Forward declaration
class Particle;
class PairPotential;

/**
 * @brief Energy computation utility for two-particle diagnostics
 *
 * Provides static methods to compute the mechanical energy of the particle
 * pair and to summarise total-energy drift over a recorded history. Drift is
 * a diagnostic only: the Verlet scheme bounds it by O(dt^2), and a large
 * drift means the timestep is too coarse, not that the run failed.
 */
class EnergyTracker
{
public:
  /**
   * @brief Instantaneous energy of the particle pair
   */
  struct SystemEnergy
  {
    double kinetic{0.0};    // Sum of both particles' KE [kcal/mol]
    double potential{0.0};  // Pair potential at current separation [kcal/mol]

    /**
     * @brief Total mechanical energy
     * @return kinetic + potential [kcal/mol]
     */
    [[nodiscard]] double total() const
    {
      return kinetic + potential;
    }
  };

  /**
   * @brief Verdict on how well total energy was conserved
   */
  enum class ConservationQuality
  {
    Excellent,   // relative drift < 0.1 %
    Good,        // relative drift < 1 %
    Significant  // consider a smaller timestep
  };

  /**
   * @brief Total-energy drift between the first and last snapshot
   */
  struct DriftStatistics
  {
    double initialTotal{0.0};          // [kcal/mol]
    double finalTotal{0.0};            // [kcal/mol]
    double relativeDriftPercent{0.0};  // |drift / initialTotal| * 100
    ConservationQuality quality{ConservationQuality::Excellent};

    /**
     * @brief Signed absolute drift
     * @return finalTotal - initialTotal [kcal/mol]
     */
    [[nodiscard]] double drift() const
    {
      return finalTotal - initialTotal;
    }
  };

  /**
   * @brief Compute energy of the particle pair
   *
   * @param first First particle
   * @param second Second particle
   * @param potential Interaction potential evaluated at |r1 - r2|
   * @return SystemEnergy; potential is +infinity for coincident particles
   */
  static SystemEnergy computeSystemEnergy(const Particle& first,
                                          const Particle& second,
                                          const PairPotential& potential);

  /**
   * @brief Summarise drift over a recorded history
   *
   * A zero or non-finite initial total gives an infinite relative drift,
   * except when the drift itself is exactly zero (reported as 0 %).
   *
   * @param history Recorded snapshots in time order
   * @return Statistics, or std::nullopt with fewer than two snapshots
   */
  static std::optional<DriftStatistics> computeDrift(
    std::span<const SimulationSnapshot> history);

  /**
   * @brief Classify a relative drift
   * @param relativeDriftPercent Relative drift in percent (non-negative)
   */
  static ConservationQuality classifyDrift(double relativeDriftPercent);
};

}  // namespace tpmd_sim

#endif  // TPMD_SIM_DIAGNOSTICS_ENERGY_TRACKER_HPP
