// Ticket: 0005_two_particle_simulation

#include "tpmd-sim/src/Simulation/TwoParticleSimulation.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "tpmd-sim/src/DataTypes/Acceleration.hpp"
#include "tpmd-sim/src/DataTypes/Coordinate.hpp"
#include "tpmd-sim/src/Environment/WallCollision.hpp"
#include "tpmd-sim/src/Physics/Integration/VelocityVerletIntegrator.hpp"
#include "tpmd-sim/src/Physics/Particle.hpp"
#include "tpmd-sim/src/Physics/PotentialEnergy/PairPotential.hpp"

namespace tpmd_sim
{

namespace
{

constexpr std::size_t index(ParticleSlot slot)
{
  return static_cast<std::size_t>(slot);
}

}  // namespace

TwoParticleSimulation::TwoParticleSimulation(
  Particle& first,
  Particle& second,
  const PairPotential& potential,
  const Config& config,
  std::shared_ptr<spdlog::logger> logger)
  : particles_{&first, &second},
    potential_{potential},
    box_{config.boxWidth, config.boxHeight},
    dt_{config.timestep},
    logger_{logger ? std::move(logger) : spdlog::default_logger()}
{
  if (!std::isfinite(dt_) || dt_ <= 0.0)
  {
    throw std::invalid_argument(
      "TwoParticleSimulation: timestep must be positive, got " +
      std::to_string(dt_));
  }
  if (&first == &second)
  {
    throw std::invalid_argument(
      "TwoParticleSimulation: first and second must be distinct particles");
  }

  computeForces();
}

void TwoParticleSimulation::computeForces()
{
  Particle& first = particle(ParticleSlot::First);
  Particle& second = particle(ParticleSlot::Second);

  // Displacement from the second particle to the first
  Coordinate const displacement = first.position - second.position;
  ForceVector const forceOnFirst = potential_.computeForce(displacement);

  first.force = forceOnFirst;
  second.force = -forceOnFirst;
}

void TwoParticleSimulation::step()
{
  // ===== Accelerations from stored forces =====

  std::array<Acceleration, 2> oldAcceleration{};
  for (std::size_t i = 0; i < particles_.size(); ++i)
  {
    oldAcceleration[i] =
      VelocityVerletIntegrator::computeAcceleration(*particles_[i]);
    VelocityVerletIntegrator::advancePosition(
      *particles_[i], oldAcceleration[i], dt_);
  }

  // ===== Wall collisions =====

  for (std::size_t i = 0; i < particles_.size(); ++i)
  {
    if (WallCollision::reflect(*particles_[i], box_))
    {
      ++wallCollisions_[i];
    }
  }

  // ===== Forces at updated positions =====

  computeForces();

  for (std::size_t i = 0; i < particles_.size(); ++i)
  {
    Acceleration const newAcceleration =
      VelocityVerletIntegrator::computeAcceleration(*particles_[i]);
    VelocityVerletIntegrator::advanceVelocity(
      *particles_[i], oldAcceleration[i], newAcceleration, dt_);
  }

  time_ += dt_;

  logger_->trace("step t={:.6f} r1={} r2={}",
                 time_,
                 particles_[0]->position,
                 particles_[1]->position);
}

void TwoParticleSimulation::run(int nSteps, int recordInterval)
{
  if (nSteps < 0)
  {
    throw std::invalid_argument(
      "TwoParticleSimulation: nSteps must be non-negative, got " +
      std::to_string(nSteps));
  }
  if (recordInterval < 1)
  {
    throw std::invalid_argument(
      "TwoParticleSimulation: recordInterval must be at least 1, got " +
      std::to_string(recordInterval));
  }

  logger_->info("Starting 2D box simulation for {} steps (dt={} fs)",
                nSteps,
                dt_);
  logger_->info("Total simulation time: {:.3f} fs", nSteps * dt_);
  logger_->info("Box size: {} x {} Angstroms",
                box_.getWidth(),
                box_.getHeight());

  recordSnapshot();

  int const progressInterval = nSteps / 10;
  for (int i = 1; i <= nSteps; ++i)
  {
    step();

    if (i % recordInterval == 0)
    {
      recordSnapshot();
    }

    if (nSteps >= 10 && i % progressInterval == 0)
    {
      logger_->info("Progress: {:.0f}%", 100.0 * i / nSteps);
    }
  }

  logger_->info("Simulation complete");
  logger_->info("Particle 1 wall collisions: {}",
                wallCollisions_[index(ParticleSlot::First)]);
  logger_->info("Particle 2 wall collisions: {}",
                wallCollisions_[index(ParticleSlot::Second)]);
  logEnergyStatistics();
}

void TwoParticleSimulation::recordSnapshot()
{
  EnergyTracker::SystemEnergy const energy = getEnergies();
  const Particle& first = getParticle(ParticleSlot::First);
  const Particle& second = getParticle(ParticleSlot::Second);

  SimulationSnapshot snapshot{};
  snapshot.time = time_;
  snapshot.position1 = first.position;
  snapshot.position2 = second.position;
  snapshot.velocity1 = first.velocity;
  snapshot.velocity2 = second.velocity;
  snapshot.kineticEnergy = energy.kinetic;
  snapshot.potentialEnergy = energy.potential;
  snapshot.totalEnergy = energy.total();
  snapshot.wallCollisions1 = wallCollisions_[index(ParticleSlot::First)];
  snapshot.wallCollisions2 = wallCollisions_[index(ParticleSlot::Second)];

  history_.push_back(snapshot);
}

void TwoParticleSimulation::logEnergyStatistics() const
{
  auto const stats = EnergyTracker::computeDrift(history_);
  if (!stats)
  {
    return;
  }

  logger_->info("Energy statistics:");
  logger_->info("  Initial total energy: {:.6f} kcal/mol", stats->initialTotal);
  logger_->info("  Final total energy:   {:.6f} kcal/mol", stats->finalTotal);
  logger_->info("  Energy drift:         {:.6e} kcal/mol", stats->drift());
  logger_->info("  Relative drift:       {:.4f}%", stats->relativeDriftPercent);

  switch (stats->quality)
  {
    case EnergyTracker::ConservationQuality::Excellent:
      logger_->info("  Excellent energy conservation");
      break;
    case EnergyTracker::ConservationQuality::Good:
      logger_->info("  Good energy conservation");
      break;
    case EnergyTracker::ConservationQuality::Significant:
      logger_->warn(
        "  Significant energy drift ({:.4f}%). Consider a smaller time step.",
        stats->relativeDriftPercent);
      break;
  }
}

EnergyTracker::SystemEnergy TwoParticleSimulation::getEnergies() const
{
  return EnergyTracker::computeSystemEnergy(getParticle(ParticleSlot::First),
                                            getParticle(ParticleSlot::Second),
                                            potential_);
}

double TwoParticleSimulation::getTime() const
{
  return time_;
}

double TwoParticleSimulation::getTimestep() const
{
  return dt_;
}

const SimulationBox& TwoParticleSimulation::getBox() const
{
  return box_;
}

const Particle& TwoParticleSimulation::getParticle(ParticleSlot slot) const
{
  return *particles_[index(slot)];
}

Particle& TwoParticleSimulation::particle(ParticleSlot slot)
{
  return *particles_[index(slot)];
}

uint32_t TwoParticleSimulation::getWallCollisionCount(ParticleSlot slot) const
{
  return wallCollisions_[index(slot)];
}

const std::vector<SimulationSnapshot>& TwoParticleSimulation::getHistory()
  const
{
  return history_;
}

}  // namespace tpmd_sim
