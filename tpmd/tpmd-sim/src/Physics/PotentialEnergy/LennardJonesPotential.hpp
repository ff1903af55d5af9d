// Ticket: 0002_lennard_jones_pair_potential

#ifndef TPMD_SIM_PHYSICS_LENNARD_JONES_POTENTIAL_HPP
#define TPMD_SIM_PHYSICS_LENNARD_JONES_POTENTIAL_HPP

#include "tpmd-sim/src/Physics/PotentialEnergy/PairPotential.hpp"

namespace tpmd_sim
{

/**
 * @brief 12-6 Lennard-Jones pair potential
 *
 * V(r) = 4 * epsilon * [(sigma/r)^12 - (sigma/r)^6]
 * F(r) = 24 * epsilon / r * [2 * (sigma/r)^12 - (sigma/r)^6]
 *
 * V crosses zero at r = sigma and reaches its minimum -epsilon at the
 * equilibrium distance r_eq = 2^(1/6) * sigma, where F vanishes.
 *
 * Typical Argon parameters: epsilon = 0.238 kcal/mol, sigma = 3.4 Angstrom.
 */
class LennardJonesPotential : public PairPotential
{
public:
  /**
   * @brief Construct potential with well depth and zero-crossing distance
   * @param epsilon Depth of the potential well [kcal/mol]
   * @param sigma Zero-crossing distance [Angstrom]
   * @throws std::invalid_argument if epsilon or sigma is not finite and
   * positive
   */
  explicit LennardJonesPotential(double epsilon = 1.0, double sigma = 1.0);

  ~LennardJonesPotential() override = default;

  // PairPotential interface implementation
  [[nodiscard]] double computeEnergy(double r) const override;
  [[nodiscard]] double computeForceMagnitude(double r) const override;

  [[nodiscard]] double getEpsilon() const;
  [[nodiscard]] double getSigma() const;

  /**
   * @brief Separation of zero force and minimum energy
   * @return 2^(1/6) * sigma [Angstrom]
   */
  [[nodiscard]] double getEquilibriumDistance() const;

  // Rule of Five
  LennardJonesPotential(const LennardJonesPotential&) = default;
  LennardJonesPotential& operator=(const LennardJonesPotential&) = default;
  LennardJonesPotential(LennardJonesPotential&&) noexcept = default;
  LennardJonesPotential& operator=(LennardJonesPotential&&) noexcept = default;

private:
  double epsilon_;  // Well depth [kcal/mol]
  double sigma_;    // Zero-crossing distance [Angstrom]
};

}  // namespace tpmd_sim

#endif  // TPMD_SIM_PHYSICS_LENNARD_JONES_POTENTIAL_HPP
