// Ticket: 0001_two_particle_core

#ifndef TPMD_SIM_ACCELERATION_HPP
#define TPMD_SIM_ACCELERATION_HPP

#include "tpmd-sim/src/DataTypes/Vec2DBase.hpp"
#include "tpmd-sim/src/DataTypes/Vec2FormatterBase.hpp"

namespace tpmd_sim
{

/**
 * @brief 2D acceleration vector type (force / mass)
 *
 * Only meaningful inside a consistent unit system; no dimensional checking
 * is performed.
 */
struct Acceleration final : detail::Vec2DBase<Acceleration>
{
  using Vec2DBase::Vec2DBase;
  using Vec2DBase::operator=;

  Acceleration() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Acceleration(const Eigen::MatrixBase<OtherDerived>& other) : Vec2DBase{other}
  {
  }
};

}  // namespace tpmd_sim

template <>
struct fmt::formatter<tpmd_sim::Acceleration>
  : tpmd_sim::detail::Vec2FormatterBase<tpmd_sim::Acceleration>
{
  template <typename FormatContext>
  auto format(const tpmd_sim::Acceleration& vec, FormatContext& ctx) const
  {
    return formatComponents(vec, ctx);
  }
};

#endif  // TPMD_SIM_ACCELERATION_HPP
