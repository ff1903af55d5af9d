// Ticket: 0007_trajectory_export

#ifndef TPMD_SIM_TRAJECTORY_WRITER_HPP
#define TPMD_SIM_TRAJECTORY_WRITER_HPP

#include <filesystem>
#include <ostream>
#include <span>
#include <string_view>

#include "tpmd-sim/src/Simulation/SimulationSnapshot.hpp"

namespace tpmd_sim
{

/**
 * @brief CSV export of a recorded simulation history
 *
 * One header row followed by one row per snapshot, columns in the order of
 * kHeader. Intended for plotting trajectories, energies and the
 * inter-particle distance with external tools.
 */
namespace TrajectoryWriter
{

inline constexpr std::string_view kHeader =
  "time,x1,y1,x2,y2,vx1,vy1,vx2,vy2,kinetic,potential,total,separation,"
  "wall_collisions_1,wall_collisions_2";

/**
 * @brief Write history as CSV to a stream
 * @param out Destination stream
 * @param history Snapshots in time order
 */
void write(std::ostream& out, std::span<const SimulationSnapshot> history);

/**
 * @brief Write history as CSV to a file, replacing any existing content
 * @param path Destination file
 * @param history Snapshots in time order
 * @throws std::runtime_error if the file cannot be opened or written
 */
void writeToFile(const std::filesystem::path& path,
                 std::span<const SimulationSnapshot> history);

}  // namespace TrajectoryWriter

}  // namespace tpmd_sim

#endif  // TPMD_SIM_TRAJECTORY_WRITER_HPP
