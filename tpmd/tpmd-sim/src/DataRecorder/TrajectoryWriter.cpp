// Ticket: 0007_trajectory_export

#include "tpmd-sim/src/DataRecorder/TrajectoryWriter.hpp"

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace tpmd_sim::TrajectoryWriter
{

void write(std::ostream& out, std::span<const SimulationSnapshot> history)
{
  out << kHeader << '\n';

  for (const auto& snapshot : history)
  {
    // Full round-trip precision for every real-valued column
    fmt::print(out,
               "{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}\n",
               snapshot.time,
               snapshot.position1.x(),
               snapshot.position1.y(),
               snapshot.position2.x(),
               snapshot.position2.y(),
               snapshot.velocity1.x(),
               snapshot.velocity1.y(),
               snapshot.velocity2.x(),
               snapshot.velocity2.y(),
               snapshot.kineticEnergy,
               snapshot.potentialEnergy,
               snapshot.totalEnergy,
               snapshot.separation(),
               snapshot.wallCollisions1,
               snapshot.wallCollisions2);
  }
}

void writeToFile(const std::filesystem::path& path,
                 std::span<const SimulationSnapshot> history)
{
  std::ofstream file{path, std::ios::out | std::ios::trunc};
  if (!file)
  {
    throw std::runtime_error("TrajectoryWriter: cannot open " + path.string());
  }

  write(file, history);

  file.flush();
  if (!file)
  {
    throw std::runtime_error("TrajectoryWriter: failed writing " +
                             path.string());
  }
}

}  // namespace tpmd_sim::TrajectoryWriter
