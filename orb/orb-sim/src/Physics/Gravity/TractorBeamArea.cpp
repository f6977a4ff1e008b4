// Ticket: 0011_tractor_beam

#include "orb-sim/src/Physics/Gravity/TractorBeamArea.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

#include "orb-sim/src/DataTypes/Vec3FormatterBase.hpp"
#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"

namespace orb_sim
{

TractorBeamArea::TractorBeamArea(std::string name,
                                 int priority,
                                 const Coordinate& center,
                                 const Coordinate& halfExtents,
                                 FaceDirection pullFace,
                                 double strength,
                                 const Eigen::Quaterniond& orientation)
  : GravityArea{std::move(name), priority, AreaMode::FixedDirection},
    center_{center},
    halfExtents_{halfExtents},
    pullFace_{pullFace},
    strength_{strength},
    orientation_{orientation.normalized()}
{
  if (halfExtents.x() <= 0.0 || halfExtents.y() <= 0.0 ||
      halfExtents.z() <= 0.0)
  {
    throw std::invalid_argument(
      "TractorBeamArea: half extents must be positive, got: (" +
      std::to_string(halfExtents.x()) + ", " +
      std::to_string(halfExtents.y()) + ", " +
      std::to_string(halfExtents.z()) + ")");
  }
  if (!(strength >= 0.0 && strength <= kMaxStrength))
  {
    throw std::invalid_argument(
      "TractorBeamArea: strength must be in [0, " +
      std::to_string(kMaxStrength) + "], got: " + std::to_string(strength));
  }
}

Coordinate TractorBeamArea::getGravityDirection(
  const GravityResolver& /*body*/) const
{
  return Coordinate{orientation_ * localFaceDirection(pullFace_)};
}

bool TractorBeamArea::contains(const Coordinate& point) const
{
  return orientedBoxContains(center_, halfExtents_, orientation_, point);
}

void TractorBeamArea::onBodyEntered(GravityResolver& body, double now)
{
  spdlog::debug("TractorBeamArea: body caught by '{}', pulling {} at {}",
                getName(),
                getGravityDirection(body),
                strength_);
  GravityArea::onBodyEntered(body, now);
}

void TractorBeamArea::onBodyExited(GravityResolver& body, double now)
{
  spdlog::debug("TractorBeamArea: body released by '{}'", getName());
  GravityArea::onBodyExited(body, now);
}

}  // namespace orb_sim
