// Ticket: 0003_rigid_body_state

#include "orb-sim/src/Physics/RigidBody/InertialState.hpp"

namespace orb_sim
{

Coordinate InertialState::getUp() const
{
  return orientation * Eigen::Vector3d::UnitY();
}

Coordinate InertialState::getForward() const
{
  return orientation * Eigen::Vector3d::UnitZ();
}

Coordinate InertialState::getRight() const
{
  return orientation * Eigen::Vector3d::UnitX();
}

}  // namespace orb_sim
