// Ticket: 0003_velocity_verlet_integration

#include "tpmd-sim/src/Physics/Integration/VelocityVerletIntegrator.hpp"

#include "tpmd-sim/src/Physics/Particle.hpp"

namespace tpmd_sim
{

Acceleration VelocityVerletIntegrator::computeAcceleration(
  const Particle& particle)
{
  return Acceleration{particle.force / particle.getMass()};
}

void VelocityVerletIntegrator::advancePosition(Particle& particle,
                                               const Acceleration& acceleration,
                                               double dt)
{
  if (particle.isFixed())
  {
    return;
  }

  // x(t+dt) = x(t) + v(t)*dt + 0.5*a(t)*dt^2
  particle.position += particle.velocity * dt + 0.5 * acceleration * dt * dt;
}

void VelocityVerletIntegrator::advanceVelocity(
  Particle& particle,
  const Acceleration& oldAcceleration,
  const Acceleration& newAcceleration,
  double dt)
{
  if (particle.isFixed())
  {
    return;
  }

  // v(t+dt) = v(t) + 0.5*(a(t) + a(t+dt))*dt
  particle.velocity += 0.5 * (oldAcceleration + newAcceleration) * dt;
}

}  // namespace tpmd_sim
