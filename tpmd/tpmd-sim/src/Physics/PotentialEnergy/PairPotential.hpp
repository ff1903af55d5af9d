// Ticket: 0002_lennard_jones_pair_potential

#ifndef TPMD_SIM_PHYSICS_PAIR_POTENTIAL_HPP
#define TPMD_SIM_PHYSICS_PAIR_POTENTIAL_HPP

#include "tpmd-sim/src/DataTypes/Coordinate.hpp"
#include "tpmd-sim/src/DataTypes/ForceVector.hpp"

namespace tpmd_sim
{

/**
 * @brief Abstract interface for central pairwise interaction potentials
 *
 * A pair potential depends only on the scalar separation r between two
 * particles. Implementations provide the energy V(r) and the radial force
 * magnitude F(r) = -dV/dr; the force vector is derived here from F(r) and
 * the displacement direction.
 *
 * Sign convention: positive F(r) is repulsive, negative is attractive.
 *
 * Separations below kMinSeparation are treated as coincident particles:
 * implementations return +infinity for the energy and zero force rather
 * than raising.
 *
 * Thread safety: Read-only methods after construction (thread-safe)
 */
class PairPotential
{
public:
  /// Separation below which two particles are considered coincident
  static constexpr double kMinSeparation = 1e-10;

  virtual ~PairPotential() = default;

  /**
   * @brief Potential energy at separation r
   * @param r Inter-particle distance [Angstrom], r >= 0
   * @return V(r) [kcal/mol], +infinity when r < kMinSeparation
   */
  [[nodiscard]] virtual double computeEnergy(double r) const = 0;

  /**
   * @brief Radial force magnitude at separation r
   * @param r Inter-particle distance [Angstrom], r >= 0
   * @return F(r) = -dV/dr [kcal/(mol*Angstrom)], 0 when r < kMinSeparation
   */
  [[nodiscard]] virtual double computeForceMagnitude(double r) const = 0;

  /**
   * @brief Force on particle A exerted by particle B
   * @param displacement Vector from particle B to particle A (r_A - r_B)
   * @return F(|d|) * d / |d|, or zero for coincident particles
   *
   * The force on particle B is the negation of the returned vector; applying
   * it is the caller's responsibility.
   */
  [[nodiscard]] ForceVector computeForce(const Coordinate& displacement) const;

protected:
  PairPotential() = default;
  PairPotential(const PairPotential&) = default;
  PairPotential& operator=(const PairPotential&) = default;
  PairPotential(PairPotential&&) noexcept = default;
  PairPotential& operator=(PairPotential&&) noexcept = default;
};

}  // namespace tpmd_sim

#endif  // TPMD_SIM_PHYSICS_PAIR_POTENTIAL_HPP
