// Ticket: 0005_gravity_areas

#include "orb-sim/src/Physics/Gravity/DirectionalGravityArea.hpp"

#include <stdexcept>
#include <utility>

#include "orb-sim/src/Utils/VectorMath.hpp"

namespace orb_sim
{

DirectionalGravityArea::DirectionalGravityArea(std::string name,
                                               int priority,
                                               const Coordinate& minCorner,
                                               const Coordinate& maxCorner,
                                               const Coordinate& direction,
                                               AreaMode mode)
  : GravityArea{std::move(name), priority, mode},
    minCorner_{minCorner},
    maxCorner_{maxCorner},
    direction_{VectorMath::normalizedOrZero(direction)}
{
  if ((maxCorner_.array() <= minCorner_.array()).any())
  {
    throw std::invalid_argument(
      "DirectionalGravityArea: maxCorner must exceed minCorner on every "
      "axis");
  }
  if (direction_.isExactlyZero())
  {
    throw std::invalid_argument(
      "DirectionalGravityArea: gravity direction must be non-zero");
  }
}

Coordinate DirectionalGravityArea::getGravityDirection(
  const GravityResolver& /*body*/) const
{
  return direction_;
}

bool DirectionalGravityArea::contains(const Coordinate& point) const
{
  return (point.array() >= minCorner_.array()).all() &&
         (point.array() <= maxCorner_.array()).all();
}

}  // namespace orb_sim
