// Ticket: 0001_two_particle_core

#include "tpmd-sim/src/Physics/Particle.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace tpmd_sim
{

Particle::Particle(const Coordinate& position,
                   const Velocity& velocity,
                   double mass,
                   bool isFixed)
  : position{position},
    velocity{velocity},
    force{0.0, 0.0},
    mass_{mass},
    fixed_{isFixed}
{
  if (!std::isfinite(mass) || mass <= 0.0)
  {
    throw std::invalid_argument("Particle: mass must be positive, got " +
                                std::to_string(mass));
  }
  if (!position.allFinite())
  {
    throw std::invalid_argument("Particle: position must be finite");
  }
  if (!velocity.allFinite())
  {
    throw std::invalid_argument("Particle: velocity must be finite");
  }
}

double Particle::kineticEnergy() const
{
  if (fixed_)
  {
    return 0.0;
  }
  return 0.5 * mass_ * velocity.dot(velocity);
}

double Particle::getMass() const
{
  return mass_;
}

bool Particle::isFixed() const
{
  return fixed_;
}

}  // namespace tpmd_sim
