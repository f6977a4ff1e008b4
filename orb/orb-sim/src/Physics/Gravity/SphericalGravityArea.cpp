// Ticket: 0005_gravity_areas

#include "orb-sim/src/Physics/Gravity/SphericalGravityArea.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"
#include "orb-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "orb-sim/src/Utils/VectorMath.hpp"

namespace orb_sim
{

SphericalGravityArea::SphericalGravityArea(std::string name,
                                           int priority,
                                           const Coordinate& center,
                                           double radius,
                                           AreaMode mode)
  : GravityArea{std::move(name), priority, mode},
    center_{center},
    radius_{radius}
{
  if (radius <= 0.0)
  {
    throw std::invalid_argument(
      "SphericalGravityArea: radius must be positive, got: " +
      std::to_string(radius));
  }
}

Coordinate SphericalGravityArea::getGravityDirection(
  const GravityResolver& body) const
{
  const Coordinate worldDown =
    VectorMath::normalizedOrZero(body.getConfig().worldDown);
  const RigidBody* rigidBody = body.getBody();
  if (rigidBody == nullptr)
  {
    return worldDown;
  }
  return VectorMath::safeNormalized(
    Coordinate{center_ - rigidBody->getPosition()}, worldDown);
}

bool SphericalGravityArea::contains(const Coordinate& point) const
{
  return (point - center_).squaredNorm() <= radius_ * radius_;
}

}  // namespace orb_sim
