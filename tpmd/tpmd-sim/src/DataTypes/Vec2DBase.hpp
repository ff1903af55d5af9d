// Ticket: 0001_two_particle_core
// Base CRTP template for 2D vector types

#ifndef TPMD_SIM_VEC2D_BASE_HPP
#define TPMD_SIM_VEC2D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace tpmd_sim::detail
{

/**
 * @brief CRTP base class for 2D vector types
 *
 * Provides common functionality for all planar vector types by inheriting
 * from Eigen::Vector2d. Derived types should use this as:
 *
 *   struct MyVec2Type final : Vec2DBase<MyVec2Type> { ... };
 *
 * @tparam Derived The derived type (CRTP pattern)
 */
template <typename Derived>
class Vec2DBase : public Eigen::Vector2d
{
public:
  static constexpr Eigen::Index X = 0;
  static constexpr Eigen::Index Y = 1;

  Vec2DBase() : Eigen::Vector2d{0.0, 0.0}
  {
  }

  Vec2DBase(double x, double y) : Eigen::Vector2d{x, y}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec2DBase(const Eigen::Vector2d& vec) : Eigen::Vector2d{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec2DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector2d{other}
  {
  }

  template <typename OtherDerived>
  Vec2DBase& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector2d::operator=(other);
    return *this;
  }

  // Rule of Zero - use compiler-generated special members
  Vec2DBase(const Vec2DBase&) = default;
  Vec2DBase(Vec2DBase&&) noexcept = default;
  Vec2DBase& operator=(const Vec2DBase&) = default;
  Vec2DBase& operator=(Vec2DBase&&) noexcept = default;
  ~Vec2DBase() = default;
};

}  // namespace tpmd_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // TPMD_SIM_VEC2D_BASE_HPP
