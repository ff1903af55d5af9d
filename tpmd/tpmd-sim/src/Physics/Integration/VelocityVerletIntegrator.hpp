// Ticket: 0003_velocity_verlet_integration

#ifndef TPMD_SIM_PHYSICS_VELOCITY_VERLET_INTEGRATOR_HPP
#define TPMD_SIM_PHYSICS_VELOCITY_VERLET_INTEGRATOR_HPP

#include "tpmd-sim/src/DataTypes/Acceleration.hpp"

namespace tpmd_sim
{

class Particle;

/**
 * @brief Velocity Verlet update stages for a single particle
 *
 * The scheme is split in two half-updates around a force evaluation, which
 * the caller performs between them:
 * 1. a_old = F(t) / m
 * 2. x(t+dt) = x(t) + v(t) * dt + 0.5 * a_old * dt^2
 * 3. (caller) apply constraints, recompute F(t+dt)
 * 4. a_new = F(t+dt) / m
 * 5. v(t+dt) = v(t) + 0.5 * (a_old + a_new) * dt
 *
 * Properties:
 * - Second-order accurate
 * - Symplectic and time-reversible
 * - Energy error bounded, O(dt^2), no secular drift for smooth forces
 *
 * Fixed particles are left untouched by both advance stages.
 *
 * Thread safety: Stateless (thread-safe)
 */
class VelocityVerletIntegrator
{
public:
  /**
   * @brief Acceleration from the force currently stored on the particle
   * @return particle.force / particle.mass
   */
  static Acceleration computeAcceleration(const Particle& particle);

  /**
   * @brief Position half of the update
   * @param particle Particle to move (no-op if fixed)
   * @param acceleration Acceleration at the start of the step
   * @param dt Timestep [fs]
   */
  static void advancePosition(Particle& particle,
                              const Acceleration& acceleration,
                              double dt);

  /**
   * @brief Velocity half of the update using the averaged acceleration
   * @param particle Particle to update (no-op if fixed)
   * @param oldAcceleration Acceleration at the start of the step
   * @param newAcceleration Acceleration at the updated position
   * @param dt Timestep [fs]
   */
  static void advanceVelocity(Particle& particle,
                              const Acceleration& oldAcceleration,
                              const Acceleration& newAcceleration,
                              double dt);
};

}  // namespace tpmd_sim

#endif  // TPMD_SIM_PHYSICS_VELOCITY_VERLET_INTEGRATOR_HPP
