// Ticket: 0002_lennard_jones_pair_potential

#include "tpmd-sim/src/Physics/PotentialEnergy/LennardJonesPotential.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace tpmd_sim
{

LennardJonesPotential::LennardJonesPotential(double epsilon, double sigma)
  : epsilon_{epsilon}, sigma_{sigma}
{
  if (!std::isfinite(epsilon) || epsilon <= 0.0)
  {
    throw std::invalid_argument(
      "LennardJonesPotential: epsilon must be positive, got " +
      std::to_string(epsilon));
  }
  if (!std::isfinite(sigma) || sigma <= 0.0)
  {
    throw std::invalid_argument(
      "LennardJonesPotential: sigma must be positive, got " +
      std::to_string(sigma));
  }
}

double LennardJonesPotential::computeEnergy(double r) const
{
  if (r < kMinSeparation)
  {
    return std::numeric_limits<double>::infinity();
  }

  // (sigma/r)^6 once; the repulsive term is its square
  double const sr = sigma_ / r;
  double const sr6 = sr * sr * sr * sr * sr * sr;
  return 4.0 * epsilon_ * (sr6 * sr6 - sr6);
}

double LennardJonesPotential::computeForceMagnitude(double r) const
{
  // Capped at the singularity instead of diverging
  if (r < kMinSeparation)
  {
    return 0.0;
  }

  double const sr = sigma_ / r;
  double const sr6 = sr * sr * sr * sr * sr * sr;
  return 24.0 * epsilon_ / r * (2.0 * sr6 * sr6 - sr6);
}

double LennardJonesPotential::getEpsilon() const
{
  return epsilon_;
}

double LennardJonesPotential::getSigma() const
{
  return sigma_;
}

double LennardJonesPotential::getEquilibriumDistance() const
{
  return std::pow(2.0, 1.0 / 6.0) * sigma_;
}

}  // namespace tpmd_sim
