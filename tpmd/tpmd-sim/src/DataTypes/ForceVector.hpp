// Ticket: 0001_two_particle_core

#ifndef TPMD_SIM_FORCE_VECTOR_HPP
#define TPMD_SIM_FORCE_VECTOR_HPP

#include "tpmd-sim/src/DataTypes/Vec2DBase.hpp"
#include "tpmd-sim/src/DataTypes/Vec2FormatterBase.hpp"

namespace tpmd_sim
{

/**
 * @brief 2D force vector type [kcal/(mol*Angstrom)]
 *
 * Thin wrapper around Vec2DBase providing:
 * - Full Eigen matrix operation compatibility
 * - fmt support (usable directly in spdlog calls)
 *
 * Memory footprint: 16 bytes (same as Eigen::Vector2d)
 */
struct ForceVector final : detail::Vec2DBase<ForceVector>
{
  using Vec2DBase::Vec2DBase;
  using Vec2DBase::operator=;

  ForceVector() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  ForceVector(const Eigen::MatrixBase<OtherDerived>& other) : Vec2DBase{other}
  {
  }
};

}  // namespace tpmd_sim

template <>
struct fmt::formatter<tpmd_sim::ForceVector>
  : tpmd_sim::detail::Vec2FormatterBase<tpmd_sim::ForceVector>
{
  template <typename FormatContext>
  auto format(const tpmd_sim::ForceVector& vec, FormatContext& ctx) const
  {
    return formatComponents(vec, ctx);
  }
};

#endif  // TPMD_SIM_FORCE_VECTOR_HPP
