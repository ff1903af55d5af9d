// Ticket: 0004_box_wall_collisions

#ifndef TPMD_SIM_ENVIRONMENT_WALL_COLLISION_HPP
#define TPMD_SIM_ENVIRONMENT_WALL_COLLISION_HPP

namespace tpmd_sim
{

class Particle;
class SimulationBox;

/**
 * @brief Stateless utility namespace for elastic particle-wall collisions.
 *
 * Each axis is checked independently:
 * - position <= 0: clamp to 0, force the velocity component to be >= 0
 * - position >= bound: clamp to bound, force the component to be <= 0
 *
 * Only the direction of the normal velocity component changes, so speed and
 * kinetic energy are preserved exactly. A particle can touch two walls (a
 * corner) in the same call.
 */
namespace WallCollision
{

/**
 * @brief Clamp a particle into the box and reflect its velocity
 * @param particle Particle to update in place
 * @param box Box bounds
 * @return true if at least one wall was touched, false otherwise or if the
 * particle is fixed
 *
 * A corner contact returns true once; callers counting collisions count one
 * event per call, not per wall.
 */
bool reflect(Particle& particle, const SimulationBox& box);

}  // namespace WallCollision

}  // namespace tpmd_sim

#endif  // TPMD_SIM_ENVIRONMENT_WALL_COLLISION_HPP
