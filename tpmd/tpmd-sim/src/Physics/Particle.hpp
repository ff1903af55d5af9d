// Ticket: 0001_two_particle_core

#ifndef TPMD_SIM_PHYSICS_PARTICLE_HPP
#define TPMD_SIM_PHYSICS_PARTICLE_HPP

#include <fmt/format.h>

#include "tpmd-sim/src/DataTypes/Coordinate.hpp"
#include "tpmd-sim/src/DataTypes/ForceVector.hpp"
#include "tpmd-sim/src/DataTypes/Velocity.hpp"

namespace tpmd_sim
{

/**
 * @brief Point particle moving in the plane of the simulation box
 *
 * Position, velocity and force are public and are updated in place by
 * TwoParticleSimulation every step. Mass and the fixed flag are set once at
 * construction.
 *
 * A fixed particle is never moved by the integrator or by wall collisions,
 * regardless of the force stored on it, and contributes no kinetic energy.
 *
 * Units: position [Angstrom], velocity [Angstrom/fs], mass [amu],
 * force [kcal/(mol*Angstrom)].
 */
class Particle
{
public:
  /**
   * @brief Construct a particle
   * @param position Initial position (copied)
   * @param velocity Initial velocity (copied)
   * @param mass Particle mass [amu]
   * @param isFixed Pin the particle in space
   *
   * @throws std::invalid_argument if mass is not finite and positive
   * @throws std::invalid_argument if a position or velocity component is not
   * finite
   */
  Particle(const Coordinate& position,
           const Velocity& velocity,
           double mass = 1.0,
           bool isFixed = false);

  /**
   * @brief Kinetic energy 0.5 * m * v.v
   * @return 0 for a fixed particle
   */
  [[nodiscard]] double kineticEnergy() const;

  [[nodiscard]] double getMass() const;

  [[nodiscard]] bool isFixed() const;

  Coordinate position;
  Velocity velocity;
  ForceVector force;  // Recomputed every step

private:
  double mass_;
  bool fixed_;
};

}  // namespace tpmd_sim

template <>
struct fmt::formatter<tpmd_sim::Particle>
{
  constexpr auto parse(fmt::format_parse_context& ctx)
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tpmd_sim::Particle& particle, FormatContext& ctx) const
  {
    return fmt::format_to(ctx.out(),
                          "Particle(pos={}, vel={}, mass={}){}",
                          particle.position,
                          particle.velocity,
                          particle.getMass(),
                          particle.isFixed() ? " [FIXED]" : "");
  }
};

#endif  // TPMD_SIM_PHYSICS_PARTICLE_HPP
