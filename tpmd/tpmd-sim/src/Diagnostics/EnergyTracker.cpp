// Ticket: 0006_energy_drift_diagnostics

#include "tpmd-sim/src/Diagnostics/EnergyTracker.hpp"

#include <cmath>
#include <limits>

#include "tpmd-sim/src/Physics/Particle.hpp"
#include "tpmd-sim/src/Physics/PotentialEnergy/PairPotential.hpp"

namespace tpmd_sim
{

EnergyTracker::SystemEnergy EnergyTracker::computeSystemEnergy(
  const Particle& first,
  const Particle& second,
  const PairPotential& potential)
{
  SystemEnergy result{};
  result.kinetic = first.kineticEnergy() + second.kineticEnergy();

  double const r = (first.position - second.position).norm();
  result.potential = potential.computeEnergy(r);

  return result;
}

std::optional<EnergyTracker::DriftStatistics> EnergyTracker::computeDrift(
  std::span<const SimulationSnapshot> history)
{
  if (history.size() < 2)
  {
    return std::nullopt;
  }

  DriftStatistics stats{};
  stats.initialTotal = history.front().totalEnergy;
  stats.finalTotal = history.back().totalEnergy;

  double const drift = stats.drift();
  if (drift == 0.0)
  {
    stats.relativeDriftPercent = 0.0;
  }
  else if (!std::isfinite(stats.initialTotal) || stats.initialTotal == 0.0 ||
           !std::isfinite(drift))
  {
    stats.relativeDriftPercent = std::numeric_limits<double>::infinity();
  }
  else
  {
    stats.relativeDriftPercent = std::abs(drift / stats.initialTotal) * 100.0;
  }

  stats.quality = classifyDrift(stats.relativeDriftPercent);
  return stats;
}

EnergyTracker::ConservationQuality EnergyTracker::classifyDrift(
  double relativeDriftPercent)
{
  if (relativeDriftPercent < 0.1)
  {
    return ConservationQuality::Excellent;
  }
  if (relativeDriftPercent < 1.0)
  {
    return ConservationQuality::Good;
  }
  return ConservationQuality::Significant;
}

}  // namespace tpmd_sim
