// Ticket: 0005_gravity_areas
// Ticket: 0006_deferred_zone_membership

#include "orb-sim/src/Physics/Gravity/GravityBox.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"

namespace orb_sim
{

Eigen::Vector3d localFaceDirection(FaceDirection face)
{
  switch (face)
  {
    case FaceDirection::Up:
      return Eigen::Vector3d::UnitY();
    case FaceDirection::Left:
      return -Eigen::Vector3d::UnitX();
    case FaceDirection::Right:
      return Eigen::Vector3d::UnitX();
    case FaceDirection::Forward:
      return Eigen::Vector3d::UnitZ();
    case FaceDirection::Back:
      return -Eigen::Vector3d::UnitZ();
    case FaceDirection::Down:
    default:
      return -Eigen::Vector3d::UnitY();
  }
}

bool orientedBoxContains(const Coordinate& center,
                         const Coordinate& halfExtents,
                         const Eigen::Quaterniond& orientation,
                         const Coordinate& point)
{
  const Eigen::Vector3d local =
    orientation.conjugate() * Eigen::Vector3d{point - center};
  return std::abs(local.x()) <= halfExtents.x() &&
         std::abs(local.y()) <= halfExtents.y() &&
         std::abs(local.z()) <= halfExtents.z();
}

void GravityBox::Config::validate() const
{
  if (gravityChangeDelay < 0.0)
  {
    throw std::invalid_argument(
      "GravityBox: gravityChangeDelay must be non-negative, got: " +
      std::to_string(gravityChangeDelay));
  }
}

GravityBox::GravityBox(std::string name,
                       int priority,
                       const Coordinate& center,
                       const Coordinate& halfExtents,
                       FaceDirection face,
                       const Eigen::Quaterniond& orientation,
                       Config config)
  : GravityArea{std::move(name), priority, config.mode},
    center_{center},
    halfExtents_{halfExtents},
    face_{face},
    orientation_{orientation.normalized()},
    config_{config}
{
  if (halfExtents.x() <= 0.0 || halfExtents.y() <= 0.0 ||
      halfExtents.z() <= 0.0)
  {
    throw std::invalid_argument(
      "GravityBox: half extents must be positive, got: (" +
      std::to_string(halfExtents.x()) + ", " +
      std::to_string(halfExtents.y()) + ", " +
      std::to_string(halfExtents.z()) + ")");
  }
  config_.validate();
}

GravityBox::GravityBox(std::string name,
                       int priority,
                       const Coordinate& center,
                       const Coordinate& halfExtents,
                       FaceDirection face,
                       const Eigen::Quaterniond& orientation)
  : GravityBox{std::move(name),
               priority,
               center,
               halfExtents,
               face,
               orientation,
               Config{}}
{
}

Coordinate GravityBox::getGravityDirection(const GravityResolver& /*body*/) const
{
  return Coordinate{orientation_ * localFaceDirection(face_)};
}

bool GravityBox::contains(const Coordinate& point) const
{
  return orientedBoxContains(center_, halfExtents_, orientation_, point);
}

void GravityBox::onBodyEntered(GravityResolver& body, double now)
{
  // Re-entering before a pending exit completes cancels the exit
  if (exiting_.erase(&body) > 0)
  {
    body.cancelPendingZoneChange(this);
  }

  if (config_.gravityChangeDelay <= 0.0)
  {
    attach(body);
    return;
  }

  spdlog::debug("GravityBox: body entered '{}', applying after {} s",
                getName(),
                config_.gravityChangeDelay);
  entering_[&body] = now;
  if (getMode() == AreaMode::Orienting)
  {
    body.notifyPendingZoneChange(this, PendingChangeKind::Add);
  }
}

void GravityBox::onBodyExited(GravityResolver& body, double now)
{
  if (entering_.erase(&body) > 0)
  {
    body.cancelPendingZoneChange(this);
  }

  if (config_.gravityChangeDelay <= 0.0)
  {
    detach(body);
    body.forceAlign(true);
    return;
  }

  spdlog::debug("GravityBox: body exited '{}', applying after {} s",
                getName(),
                config_.gravityChangeDelay);
  exiting_[&body] = now;
  if (getMode() == AreaMode::Orienting)
  {
    body.notifyPendingZoneChange(this, PendingChangeKind::Remove);
  }
}

void GravityBox::update(double now)
{
  std::vector<GravityResolver*> due;

  for (const auto& [body, enteredAt] : entering_)
  {
    if (now - enteredAt >= config_.gravityChangeDelay)
    {
      due.push_back(body);
    }
  }
  for (GravityResolver* body : due)
  {
    entering_.erase(body);
    attach(*body);
    spdlog::debug("GravityBox: delayed entry into '{}' applied", getName());
  }

  due.clear();
  for (const auto& [body, exitedAt] : exiting_)
  {
    if (now - exitedAt >= config_.gravityChangeDelay)
    {
      due.push_back(body);
    }
  }
  for (GravityResolver* body : due)
  {
    exiting_.erase(body);
    detach(*body);
    body->forceAlign(true);
    spdlog::debug("GravityBox: delayed exit from '{}' applied", getName());
  }
}

void GravityBox::forgetBody(GravityResolver& body)
{
  entering_.erase(&body);
  exiting_.erase(&body);
}

bool GravityBox::isEntryPending(const GravityResolver& body) const
{
  return std::ranges::any_of(entering_,
                             [&body](const auto& entry)
                             { return entry.first == &body; });
}

bool GravityBox::isExitPending(const GravityResolver& body) const
{
  return std::ranges::any_of(exiting_,
                             [&body](const auto& entry)
                             { return entry.first == &body; });
}

}  // namespace orb_sim
