// Ticket: 0006_energy_drift_diagnostics
// Test: EnergyTracker unit tests

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "tpmd-sim/src/Diagnostics/EnergyTracker.hpp"
#include "tpmd-sim/src/Physics/Particle.hpp"
#include "tpmd-sim/src/Physics/PotentialEnergy/LennardJonesPotential.hpp"

namespace tpmd_sim
{
namespace test
{

// ========== Helper: history with given total energies ==========

static std::vector<SimulationSnapshot> makeHistory(
  std::initializer_list<double> totals)
{
  std::vector<SimulationSnapshot> history;
  double time = 0.0;
  for (double const total : totals)
  {
    SimulationSnapshot snapshot{};
    snapshot.time = time;
    snapshot.totalEnergy = total;
    history.push_back(snapshot);
    time += 1.0;
  }
  return history;
}

// ========== System Energy ==========

TEST(EnergyTracker, SystemEnergy_SumsKineticAndEvaluatesPair)
{
  LennardJonesPotential const potential{0.238, 3.4};
  Particle const first{Coordinate{5.0, 10.0}, Velocity{0.1, 0.0}, 2.0};
  Particle const second{Coordinate{9.0, 10.0}, Velocity{0.0, -0.2}, 3.0};

  auto const energy =
    EnergyTracker::computeSystemEnergy(first, second, potential);

  // KE = 0.5*2*0.01 + 0.5*3*0.04 = 0.01 + 0.06
  EXPECT_NEAR(energy.kinetic, 0.07, 1e-12);
  EXPECT_DOUBLE_EQ(energy.potential, potential.computeEnergy(4.0));
  EXPECT_DOUBLE_EQ(energy.total(), energy.kinetic + energy.potential);
}

TEST(EnergyTracker, SystemEnergy_FixedParticleContributesNoKinetic)
{
  LennardJonesPotential const potential{};
  Particle const moving{Coordinate{0.0, 0.0}, Velocity{1.0, 0.0}, 2.0};
  Particle const pinned{Coordinate{3.0, 4.0}, Velocity{5.0, 5.0}, 2.0, true};

  auto const energy =
    EnergyTracker::computeSystemEnergy(moving, pinned, potential);

  EXPECT_DOUBLE_EQ(energy.kinetic, 1.0);
  EXPECT_DOUBLE_EQ(energy.potential, potential.computeEnergy(5.0));
}

TEST(EnergyTracker, SystemEnergy_CoincidentParticles_InfinitePotential)
{
  LennardJonesPotential const potential{};
  Particle const first{Coordinate{1.0, 1.0}, Velocity{0.0, 0.0}};
  Particle const second{Coordinate{1.0, 1.0}, Velocity{0.0, 0.0}};

  auto const energy =
    EnergyTracker::computeSystemEnergy(first, second, potential);

  EXPECT_TRUE(std::isinf(energy.potential));
  EXPECT_TRUE(std::isinf(energy.total()));
}

// ========== Drift Statistics ==========

TEST(EnergyTracker, Drift_FewerThanTwoSnapshots_NoStatistics)
{
  EXPECT_FALSE(EnergyTracker::computeDrift(makeHistory({})).has_value());
  EXPECT_FALSE(EnergyTracker::computeDrift(makeHistory({-1.0})).has_value());
}

TEST(EnergyTracker, Drift_UsesFirstAndLastSnapshot)
{
  auto const history = makeHistory({-2.0, 5.0, -7.0, -2.001});

  auto const stats = EnergyTracker::computeDrift(history);

  ASSERT_TRUE(stats.has_value());
  EXPECT_DOUBLE_EQ(stats->initialTotal, -2.0);
  EXPECT_DOUBLE_EQ(stats->finalTotal, -2.001);
  EXPECT_NEAR(stats->drift(), -0.001, 1e-12);
  EXPECT_NEAR(stats->relativeDriftPercent, 0.05, 1e-9);
  EXPECT_EQ(stats->quality, EnergyTracker::ConservationQuality::Excellent);
}

TEST(EnergyTracker, Drift_ZeroInitialEnergy)
{
  auto const unchanged = EnergyTracker::computeDrift(makeHistory({0.0, 0.0}));
  auto const changed = EnergyTracker::computeDrift(makeHistory({0.0, 0.1}));

  ASSERT_TRUE(unchanged.has_value());
  ASSERT_TRUE(changed.has_value());
  EXPECT_EQ(unchanged->relativeDriftPercent, 0.0);
  EXPECT_TRUE(std::isinf(changed->relativeDriftPercent));
  EXPECT_EQ(changed->quality, EnergyTracker::ConservationQuality::Significant);
}

TEST(EnergyTracker, ClassifyDrift_Thresholds)
{
  using Quality = EnergyTracker::ConservationQuality;

  EXPECT_EQ(EnergyTracker::classifyDrift(0.0), Quality::Excellent);
  EXPECT_EQ(EnergyTracker::classifyDrift(0.099), Quality::Excellent);
  EXPECT_EQ(EnergyTracker::classifyDrift(0.1), Quality::Good);
  EXPECT_EQ(EnergyTracker::classifyDrift(0.99), Quality::Good);
  EXPECT_EQ(EnergyTracker::classifyDrift(1.0), Quality::Significant);
  EXPECT_EQ(EnergyTracker::classifyDrift(
              std::numeric_limits<double>::infinity()),
            Quality::Significant);
}

}  // namespace test
}  // namespace tpmd_sim
