// Ticket: 0003_rigid_body_state

#include "orb-sim/src/Physics/RigidBody/RigidBody.hpp"

#include <stdexcept>
#include <string>

namespace orb_sim
{

RigidBody::RigidBody(double mass,
                     const Coordinate& position,
                     const Eigen::Quaterniond& orientation)
  : mass_{mass}
{
  if (mass <= 0.0)
  {
    throw std::invalid_argument("RigidBody: mass must be positive, got: " +
                                std::to_string(mass));
  }
  state_.position = position;
  state_.orientation = orientation.normalized();
}

void RigidBody::applyAcceleration(const Acceleration& acceleration)
{
  accumulatedAcceleration_ += acceleration;
}

void RigidBody::applyVelocityChange(const Velocity& deltaV)
{
  state_.velocity += deltaV;
}

Acceleration RigidBody::consumeAccumulatedAcceleration()
{
  Acceleration total = accumulatedAcceleration_;
  accumulatedAcceleration_ = Acceleration{0.0, 0.0, 0.0};
  return total;
}

void RigidBody::setOrientation(const Eigen::Quaterniond& orientation)
{
  state_.orientation = orientation.normalized();
}

void RigidBody::setMass(double mass)
{
  if (mass <= 0.0)
  {
    throw std::invalid_argument("RigidBody: mass must be positive, got: " +
                                std::to_string(mass));
  }
  mass_ = mass;
}

}  // namespace orb_sim
