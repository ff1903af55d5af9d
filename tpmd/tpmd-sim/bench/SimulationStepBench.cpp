// Ticket: 0005_two_particle_simulation

#include <benchmark/benchmark.h>
#include <memory>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include "tpmd-sim/src/DataTypes/Coordinate.hpp"
#include "tpmd-sim/src/Physics/Particle.hpp"
#include "tpmd-sim/src/Physics/PotentialEnergy/LennardJonesPotential.hpp"
#include "tpmd-sim/src/Simulation/TwoParticleSimulation.hpp"

using namespace tpmd_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

std::shared_ptr<spdlog::logger> makeQuietLogger()
{
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>("bench", sink);
}

}  // namespace

// ============================================================================
// Pair Potential
// ============================================================================

/**
 * @brief Benchmark a single Lennard-Jones force evaluation from a displacement.
 */
static void BM_LennardJones_ComputeForce(benchmark::State& state)
{
  LennardJonesPotential const potential{0.238, 3.4};
  Coordinate const displacement{3.1, 2.2};

  for (auto _ : state)
  {
    ForceVector force = potential.computeForce(displacement);
    benchmark::DoNotOptimize(force);
  }
}
BENCHMARK(BM_LennardJones_ComputeForce);

// ============================================================================
// Simulation Loop
// ============================================================================

/**
 * @brief Benchmark Velocity Verlet steps with wall reflection.
 *
 * Argon pair with one particle fixed, as in the demo executable.
 */
static void BM_TwoParticleSimulation_Step(benchmark::State& state)
{
  Particle moving{Coordinate{5.0, 10.0}, Velocity{0.02, 0.02}, 39.948};
  Particle anchor{Coordinate{15.0, 10.0}, Velocity{0.0, 0.0}, 39.948, true};
  LennardJonesPotential const potential{0.238, 3.4};
  TwoParticleSimulation::Config config;
  config.timestep = 1.0;

  TwoParticleSimulation sim{
    moving, anchor, potential, config, makeQuietLogger()};

  for (auto _ : state)
  {
    sim.step();
    benchmark::DoNotOptimize(moving.position);
  }
}
BENCHMARK(BM_TwoParticleSimulation_Step);

/**
 * @brief Benchmark run() including snapshot recording.
 */
static void BM_TwoParticleSimulation_Run(benchmark::State& state)
{
  int const nSteps = static_cast<int>(state.range(0));
  LennardJonesPotential const potential{0.238, 3.4};
  TwoParticleSimulation::Config config;
  config.timestep = 1.0;
  auto logger = makeQuietLogger();

  for (auto _ : state)
  {
    Particle moving{Coordinate{5.0, 10.0}, Velocity{0.02, 0.02}, 39.948};
    Particle anchor{Coordinate{15.0, 10.0}, Velocity{0.0, 0.0}, 39.948, true};
    TwoParticleSimulation sim{moving, anchor, potential, config, logger};
    sim.run(nSteps, 10);
    benchmark::DoNotOptimize(sim.getHistory().data());
  }
  state.SetComplexityN(nSteps);
}
BENCHMARK(BM_TwoParticleSimulation_Run)
  ->Arg(100)
  ->Arg(1000)
  ->Arg(10000)
  ->Complexity();

BENCHMARK_MAIN();
