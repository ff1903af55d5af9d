// Ticket: 0007_trajectory_export

// Demonstration run: an Argon atom moving past a pinned Argon atom in a
// 20 x 20 Angstrom box. Pass a file path to export the trajectory as CSV.

#include <algorithm>
#include <exception>
#include <random>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "tpmd-sim/src/DataRecorder/TrajectoryWriter.hpp"
#include "tpmd-sim/src/DataTypes/Coordinate.hpp"
#include "tpmd-sim/src/DataTypes/Velocity.hpp"
#include "tpmd-sim/src/Physics/Particle.hpp"
#include "tpmd-sim/src/Physics/PotentialEnergy/LennardJonesPotential.hpp"
#include "tpmd-sim/src/Simulation/TwoParticleSimulation.hpp"

using namespace tpmd_sim;

namespace
{

// Argon-Argon Lennard-Jones parameters
constexpr double kEpsilon = 0.238;  // kcal/mol
constexpr double kSigma = 3.4;      // Angstrom
constexpr double kArgonMass = 39.948;  // amu

constexpr double kBoxSize = 20.0;      // Angstrom
constexpr double kWallMargin = 2.0;    // Angstrom
constexpr unsigned kRandomSeed = 42;

constexpr int kSteps = 5000;

}  // namespace

int main(int argc, char* argv[])
{
  auto logger = spdlog::stdout_color_mt("tpmd");
  logger->set_level(spdlog::level::info);

  try
  {
    LennardJonesPotential const potential{kEpsilon, kSigma};

    // Place both particles away from the walls and at least 2 sigma apart
    std::mt19937 rng{kRandomSeed};
    std::uniform_real_distribution<double> placement{kWallMargin,
                                                     kBoxSize - kWallMargin};
    double const minSeparation = 2.0 * kSigma;

    Coordinate pos1;
    Coordinate pos2;
    do
    {
      pos1 = Coordinate{placement(rng), placement(rng)};
      pos2 = Coordinate{placement(rng), placement(rng)};
    } while ((pos1 - pos2).norm() < minSeparation);

    logger->info("Random seed: {}", kRandomSeed);
    logger->info("Particle 1 starting position: {:.2f}", pos1);
    logger->info("Particle 2 starting position: {:.2f}", pos2);
    logger->info("Initial separation: {:.2f} Angstroms", (pos1 - pos2).norm());

    Particle moving{pos1, Velocity{0.02, 0.02}, kArgonMass};
    Particle pinned{pos2, Velocity{0.0, 0.0}, kArgonMass, true};
    logger->info("{}", moving);
    logger->info("{}", pinned);

    TwoParticleSimulation::Config config{};
    config.boxWidth = kBoxSize;
    config.boxHeight = kBoxSize;
    config.timestep = 1.0;  // fs

    TwoParticleSimulation simulation{moving, pinned, potential, config, logger};
    simulation.run(kSteps, 1);

    auto const& history = simulation.getHistory();
    auto const [closest, farthest] = std::minmax_element(
      history.begin(),
      history.end(),
      [](const SimulationSnapshot& a, const SimulationSnapshot& b)
      { return a.separation() < b.separation(); });
    logger->info("Separation range: {:.3f} to {:.3f} Angstroms "
                 "(LJ equilibrium {:.3f})",
                 closest->separation(),
                 farthest->separation(),
                 potential.getEquilibriumDistance());

    if (argc > 1)
    {
      TrajectoryWriter::writeToFile(argv[1], simulation.getHistory());
      logger->info("Trajectory written to {}", argv[1]);
    }
  }
  catch (const std::exception& e)
  {
    logger->error("Simulation failed: {}", e.what());
    return 1;
  }

  return 0;
}
