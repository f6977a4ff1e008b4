#ifndef ORB_SIM_ACCELERATION_HPP
#define ORB_SIM_ACCELERATION_HPP

#include "orb-sim/src/DataTypes/Vec3DBase.hpp"

namespace orb_sim
{

/**
 * @brief 3D acceleration vector type [m/s^2]
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Acceleration final : detail::Vec3DBase<Acceleration>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Acceleration(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace orb_sim

#endif  // ORB_SIM_ACCELERATION_HPP
