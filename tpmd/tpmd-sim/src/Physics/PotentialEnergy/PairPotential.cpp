// Ticket: 0002_lennard_jones_pair_potential

#include "tpmd-sim/src/Physics/PotentialEnergy/PairPotential.hpp"

namespace tpmd_sim
{

ForceVector PairPotential::computeForce(const Coordinate& displacement) const
{
  double const r = displacement.norm();
  if (r < kMinSeparation)
  {
    return ForceVector{0.0, 0.0};
  }

  // Unit vector pointing from particle B to particle A
  Coordinate const direction = displacement / r;
  return ForceVector{computeForceMagnitude(r) * direction};
}

}  // namespace tpmd_sim
