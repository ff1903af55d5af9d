// Ticket: 0001_two_particle_core

#ifndef TPMD_SIM_COORDINATE_HPP
#define TPMD_SIM_COORDINATE_HPP

#include "tpmd-sim/src/DataTypes/Vec2DBase.hpp"
#include "tpmd-sim/src/DataTypes/Vec2FormatterBase.hpp"

namespace tpmd_sim
{

// Position in the box frame [Angstrom]. Also used for displacements.
struct Coordinate final : detail::Vec2DBase<Coordinate>
{
  using Vec2DBase::Vec2DBase;
  using Vec2DBase::operator=;

  Coordinate() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec2DBase{other}
  {
  }
};

}  // namespace tpmd_sim

template <>
struct fmt::formatter<tpmd_sim::Coordinate>
  : tpmd_sim::detail::Vec2FormatterBase<tpmd_sim::Coordinate>
{
  template <typename FormatContext>
  auto format(const tpmd_sim::Coordinate& vec, FormatContext& ctx) const
  {
    return formatComponents(vec, ctx);
  }
};

#endif  // TPMD_SIM_COORDINATE_HPP
