// Ticket: 0001_gravity_datatypes

#ifndef ORB_SIM_COORDINATE_HPP
#define ORB_SIM_COORDINATE_HPP

#include "orb-sim/src/DataTypes/Vec3DBase.hpp"

namespace orb_sim
{

/**
 * @brief 3D position or free direction vector [m]
 *
 * Gravity directions, surface normals and body axes are all carried as
 * Coordinate; a gravity direction is either unit length or exactly zero.
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace orb_sim

#endif  // ORB_SIM_COORDINATE_HPP
