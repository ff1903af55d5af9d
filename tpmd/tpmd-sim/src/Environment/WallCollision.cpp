// Ticket: 0004_box_wall_collisions

#include "tpmd-sim/src/Environment/WallCollision.hpp"

#include <cmath>

#include "tpmd-sim/src/Environment/SimulationBox.hpp"
#include "tpmd-sim/src/Physics/Particle.hpp"

namespace tpmd_sim::WallCollision
{

namespace
{

// Reflect one axis against [0, upper]. Returns true on contact.
bool reflectAxis(double& position, double& velocity, double upper)
{
  if (position <= 0.0)
  {
    position = 0.0;
    velocity = std::abs(velocity);
    return true;
  }
  if (position >= upper)
  {
    position = upper;
    velocity = -std::abs(velocity);
    return true;
  }
  return false;
}

}  // namespace

bool reflect(Particle& particle, const SimulationBox& box)
{
  if (particle.isFixed())
  {
    return false;
  }

  // Evaluate both axes unconditionally so corner hits reflect both components
  bool const hitX = reflectAxis(particle.position[Coordinate::X],
                                particle.velocity[Velocity::X],
                                box.getWidth());
  bool const hitY = reflectAxis(particle.position[Coordinate::Y],
                                particle.velocity[Velocity::Y],
                                box.getHeight());
  return hitX || hitY;
}

}  // namespace tpmd_sim::WallCollision
