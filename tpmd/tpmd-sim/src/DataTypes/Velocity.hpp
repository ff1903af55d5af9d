// Ticket: 0001_two_particle_core

#ifndef TPMD_SIM_VELOCITY_HPP
#define TPMD_SIM_VELOCITY_HPP

#include "tpmd-sim/src/DataTypes/Vec2DBase.hpp"
#include "tpmd-sim/src/DataTypes/Vec2FormatterBase.hpp"

namespace tpmd_sim
{

/**
 * @brief 2D velocity vector type [Angstrom/fs]
 *
 * Thin wrapper around Vec2DBase providing:
 * - Full Eigen matrix operation compatibility
 * - fmt support (usable directly in spdlog calls)
 *
 * Memory footprint: 16 bytes (same as Eigen::Vector2d)
 */
struct Velocity final : detail::Vec2DBase<Velocity>
{
  using Vec2DBase::Vec2DBase;
  using Vec2DBase::operator=;

  Velocity() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Velocity(const Eigen::MatrixBase<OtherDerived>& other) : Vec2DBase{other}
  {
  }
};

}  // namespace tpmd_sim

template <>
struct fmt::formatter<tpmd_sim::Velocity>
  : tpmd_sim::detail::Vec2FormatterBase<tpmd_sim::Velocity>
{
  template <typename FormatContext>
  auto format(const tpmd_sim::Velocity& vec, FormatContext& ctx) const
  {
    return formatComponents(vec, ctx);
  }
};

#endif  // TPMD_SIM_VELOCITY_HPP
