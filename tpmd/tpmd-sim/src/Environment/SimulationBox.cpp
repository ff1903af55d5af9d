// Ticket: 0004_box_wall_collisions

#include "tpmd-sim/src/Environment/SimulationBox.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace tpmd_sim
{

SimulationBox::SimulationBox(double width, double height)
  : width_{width}, height_{height}
{
  if (!std::isfinite(width) || width <= 0.0)
  {
    throw std::invalid_argument("SimulationBox: width must be positive, got " +
                                std::to_string(width));
  }
  if (!std::isfinite(height) || height <= 0.0)
  {
    throw std::invalid_argument(
      "SimulationBox: height must be positive, got " + std::to_string(height));
  }
}

double SimulationBox::getWidth() const
{
  return width_;
}

double SimulationBox::getHeight() const
{
  return height_;
}

bool SimulationBox::contains(const Coordinate& point) const
{
  return point.x() >= 0.0 && point.x() <= width_ && point.y() >= 0.0 &&
         point.y() <= height_;
}

}  // namespace tpmd_sim
