// Ticket: 0001_gravity_datatypes

#ifndef ORB_SIM_VEC3D_BASE_HPP
#define ORB_SIM_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace orb_sim::detail
{

/**
 * @brief Shared base of Coordinate, Velocity and Acceleration
 *
 * Lets Eigen expressions assign straight back to the semantic type.
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Derived& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return static_cast<Derived&>(*this);
  }

  /// True when every component is exactly zero (the "no direction" sentinel)
  [[nodiscard]] bool isExactlyZero() const
  {
    return x() == 0.0 && y() == 0.0 && z() == 0.0;
  }

  Vec3DBase(const Vec3DBase&) = default;
  Vec3DBase(Vec3DBase&&) noexcept = default;
  Vec3DBase& operator=(const Vec3DBase&) = default;
  Vec3DBase& operator=(Vec3DBase&&) noexcept = default;
  ~Vec3DBase() = default;
};

}  // namespace orb_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // ORB_SIM_VEC3D_BASE_HPP
