// Ticket: 0004_box_wall_collisions

#ifndef TPMD_SIM_ENVIRONMENT_SIMULATION_BOX_HPP
#define TPMD_SIM_ENVIRONMENT_SIMULATION_BOX_HPP

#include "tpmd-sim/src/DataTypes/Coordinate.hpp"

namespace tpmd_sim
{

/**
 * @brief Axis-aligned rectangular region [0, width] x [0, height]
 *
 * The lower-left corner is always the origin. Walls are hard and the box
 * does not wrap (no periodic images).
 */
class SimulationBox
{
public:
  /**
   * @brief Construct box with given extents
   * @param width Extent along x [Angstrom]
   * @param height Extent along y [Angstrom]
   * @throws std::invalid_argument if either extent is not finite and positive
   */
  SimulationBox(double width, double height);

  [[nodiscard]] double getWidth() const;
  [[nodiscard]] double getHeight() const;

  /// True if the point lies inside the box or on its boundary
  [[nodiscard]] bool contains(const Coordinate& point) const;

private:
  double width_;
  double height_;
};

}  // namespace tpmd_sim

#endif  // TPMD_SIM_ENVIRONMENT_SIMULATION_BOX_HPP
