// Ticket: 0004_gravity_resolver
// Ticket: 0006_deferred_zone_membership

#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

#include "orb-sim/src/DataTypes/Acceleration.hpp"
#include "orb-sim/src/DataTypes/Vec3FormatterBase.hpp"
#include "orb-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "orb-sim/src/Utils/VectorMath.hpp"

namespace orb_sim
{

namespace
{

const Coordinate kZero{0.0, 0.0, 0.0};

const char* toString(PendingChangeKind kind)
{
  return kind == PendingChangeKind::Add ? "add" : "remove";
}

}  // namespace

void GravityResolver::Config::validate() const
{
  if (gravityMagnitude < 0.0)
  {
    throw std::invalid_argument(
      "GravityResolver: gravityMagnitude must be non-negative, got: " +
      std::to_string(gravityMagnitude));
  }
  if (gradualAlignmentSpeed < 0.0)
  {
    throw std::invalid_argument(
      "GravityResolver: gradualAlignmentSpeed must be non-negative, got: " +
      std::to_string(gradualAlignmentSpeed));
  }
  if (gravityTransitionSpeed <= 0.0)
  {
    throw std::invalid_argument(
      "GravityResolver: gravityTransitionSpeed must be positive, got: " +
      std::to_string(gravityTransitionSpeed));
  }
  if (spaceGravityMagnitude < 0.0)
  {
    throw std::invalid_argument(
      "GravityResolver: spaceGravityMagnitude must be non-negative, got: " +
      std::to_string(spaceGravityMagnitude));
  }
  if (directionChangeDot <= -1.0 || directionChangeDot > 1.0)
  {
    throw std::invalid_argument(
      "GravityResolver: directionChangeDot must be in (-1, 1], got: " +
      std::to_string(directionChangeDot));
  }
  if (transitionGraceWindow < 0.0)
  {
    throw std::invalid_argument(
      "GravityResolver: transitionGraceWindow must be non-negative, got: " +
      std::to_string(transitionGraceWindow));
  }
  if (pendingChangeTimeout < 0.0)
  {
    throw std::invalid_argument(
      "GravityResolver: pendingChangeTimeout must be non-negative, got: " +
      std::to_string(pendingChangeTimeout));
  }
  if (worldDown.norm() < VectorMath::kMinDirectionNorm)
  {
    throw std::invalid_argument(
      "GravityResolver: worldDown must have a direction");
  }
}

GravityResolver::GravityResolver(RigidBody* body, Config config)
  : body_{body}, config_{std::move(config)}
{
  config_.validate();
  worldDown_ = VectorMath::normalizedOrZero(config_.worldDown);
  forceMagnitude_ = config_.gravityMagnitude;
  lastValidDirection_ = worldDown_;
  lastAppliedDirection_ =
    body_ != nullptr ? Coordinate{-body_->getUp()} : worldDown_;
}

GravityResolver::GravityResolver(RigidBody* body)
  : GravityResolver{body, Config{}}
{
}

// ===== Zone membership =====

void GravityResolver::addZone(const GravitySource* zone)
{
  if (zone == nullptr)
  {
    spdlog::warn("GravityResolver: ignoring null gravity zone on add");
    return;
  }

  clearPendingChange(zone, PendingChangeKind::Add);
  if (hasZone(zone))
  {
    return;
  }

  zones_.push_back(zone);
  refreshDirection();
  spdlog::debug("GravityResolver: zone '{}' (priority {}) added, down {}",
                zone->getName(),
                zone->getPriority(),
                gravityDirection_);

  forceAlign(true);
}

void GravityResolver::removeZone(const GravitySource* zone)
{
  if (zone == nullptr)
  {
    spdlog::warn("GravityResolver: ignoring null gravity zone on remove");
    return;
  }

  clearPendingChange(zone, PendingChangeKind::Remove);
  auto it = std::find(zones_.begin(), zones_.end(), zone);
  if (it == zones_.end())
  {
    return;
  }

  zones_.erase(it);
  refreshDirection();
  spdlog::debug("GravityResolver: zone '{}' removed, down {}",
                zone->getName(),
                gravityDirection_);

  forceAlign(true);
}

bool GravityResolver::hasZone(const GravitySource* zone) const
{
  return std::find(zones_.begin(), zones_.end(), zone) != zones_.end();
}

void GravityResolver::addFixedDirectionSource(const GravitySource* source)
{
  if (source == nullptr)
  {
    spdlog::warn("GravityResolver: ignoring null fixed-direction source");
    return;
  }
  if (std::find(fixedSources_.begin(), fixedSources_.end(), source) !=
      fixedSources_.end())
  {
    return;
  }
  fixedSources_.push_back(source);
  refreshDirection();
}

void GravityResolver::removeFixedDirectionSource(const GravitySource* source)
{
  auto it = std::find(fixedSources_.begin(), fixedSources_.end(), source);
  if (it == fixedSources_.end())
  {
    return;
  }
  fixedSources_.erase(it);
  refreshDirection();
}

// ===== Deferred membership safety net =====

void GravityResolver::notifyPendingZoneChange(const GravitySource* zone,
                                              PendingChangeKind kind)
{
  if (zone == nullptr)
  {
    spdlog::warn("GravityResolver: ignoring pending change for null zone");
    return;
  }
  cancelPendingZoneChange(zone);
  pendingChanges_.push_back(
    PendingZoneChange{zone, kind, simTime_ + config_.pendingChangeTimeout});
}

void GravityResolver::cancelPendingZoneChange(const GravitySource* zone)
{
  std::erase_if(pendingChanges_,
                [zone](const PendingZoneChange& change)
                { return change.zone == zone; });
}

void GravityResolver::cancelPendingZoneChanges()
{
  pendingChanges_.clear();
}

void GravityResolver::clearPendingChange(const GravitySource* zone,
                                         PendingChangeKind kind)
{
  std::erase_if(pendingChanges_,
                [zone, kind](const PendingZoneChange& change)
                { return change.zone == zone && change.kind == kind; });
}

void GravityResolver::processPendingChanges()
{
  if (pendingChanges_.empty())
  {
    return;
  }

  std::vector<PendingZoneChange> due;
  for (const auto& change : pendingChanges_)
  {
    if (simTime_ >= change.deadline)
    {
      due.push_back(change);
    }
  }
  std::erase_if(pendingChanges_,
                [this](const PendingZoneChange& change)
                { return simTime_ >= change.deadline; });

  for (const auto& change : due)
  {
    spdlog::warn(
      "GravityResolver: pending {} of zone '{}' not applied after {} s, "
      "applying it now",
      toString(change.kind),
      change.zone->getName(),
      config_.pendingChangeTimeout);
    if (change.kind == PendingChangeKind::Add)
    {
      addZone(change.zone);
    }
    else
    {
      removeZone(change.zone);
    }
  }
}

// ===== Simulation =====

void GravityResolver::update(double dt)
{
  dt = std::max(dt, 0.0);
  simTime_ += dt;

  processPendingChanges();
  expireTransition();

  if (dashActive_ && !config_.processGravityDuringDash)
  {
    return;
  }

  refreshDirection();
  if (!dashActive_)
  {
    applyGravityAcceleration();
  }
  alignOrientation(dt);
}

Coordinate GravityResolver::resolve(std::vector<const GravitySource*>& sources)
{
  if (sources.empty())
  {
    return kZero;
  }

  // Ascending by priority, insertion order kept among equals; the last
  // element is the most recently added of the highest priority
  std::stable_sort(sources.begin(),
                   sources.end(),
                   [](const GravitySource* a, const GravitySource* b)
                   { return a->getPriority() < b->getPriority(); });

  const GravitySource* dominant = sources.back();
  const Coordinate raw = dominant->getGravityDirection(*this);
  Coordinate direction = VectorMath::normalizedOrZero(raw);
  if (direction.isExactlyZero() || !direction.allFinite())
  {
    spdlog::warn(
      "GravityResolver: zone '{}' returned degenerate direction {}, using "
      "world down {}",
      dominant->getName(),
      raw,
      worldDown_);
    direction = worldDown_;
  }
  return direction;
}

void GravityResolver::refreshDirection()
{
  orientingDirection_ = resolve(zones_);
  const Coordinate fixed = resolve(fixedSources_);

  gravityDirection_ = fixed.isExactlyZero() ? orientingDirection_ : fixed;
  // resolve() left the dominant fixed source last
  forceMagnitude_ =
    fixed.isExactlyZero()
      ? config_.gravityMagnitude
      : fixedSources_.back()->getGravityStrength().value_or(
          config_.gravityMagnitude);
  if (!gravityDirection_.isExactlyZero())
  {
    lastValidDirection_ = gravityDirection_;
  }

  updateSpaceState();
}

void GravityResolver::updateSpaceState()
{
  const bool nowInSpace = zones_.empty() && fixedSources_.empty();
  if (nowInSpace == inSpace_)
  {
    return;
  }

  inSpace_ = nowInSpace;
  spaceSteering_ = false;
  if (inSpace_)
  {
    const Coordinate& remembered =
      config_.maintainOrientationInSpace ? lastValidDirection_ : kZero;
    spdlog::debug("GravityResolver: entered space, remembered down {}",
                  remembered);
    if (!config_.maintainOrientationInSpace)
    {
      // A free body keeps whatever orientation it has in space
      abandonSmoothTransition();
      orientationState_ = OrientationState::Stable;
    }
    notifySpaceTransition(true, remembered);
  }
  else
  {
    spdlog::debug("GravityResolver: left space, down {}", gravityDirection_);
    notifySpaceTransition(false, gravityDirection_);
  }
}

void GravityResolver::applyGravityAcceleration()
{
  if (body_ == nullptr)
  {
    return;
  }

  if (!inSpace_)
  {
    body_->applyAcceleration(
      Acceleration{gravityDirection_ * forceMagnitude_});
  }
  else if (config_.maintainOrientationInSpace &&
           config_.spaceGravityMagnitude > 0.0)
  {
    body_->applyAcceleration(
      Acceleration{lastValidDirection_ * config_.spaceGravityMagnitude});
  }
}

void GravityResolver::alignOrientation(double dt)
{
  if (inSpace_)
  {
    if (config_.maintainOrientationInSpace && spaceSteering_ && !dashActive_)
    {
      alignGradually(-lastValidDirection_, dt);
      lastAppliedDirection_ = lastValidDirection_;
    }
    return;
  }

  // Fixed-direction sources alone never rotate the body
  if (orientingDirection_.isExactlyZero() || dashActive_)
  {
    return;
  }

  if (isBigChange(lastAppliedDirection_, orientingDirection_))
  {
    snapTo(orientingDirection_);
    return;
  }

  if (smoothTransition_)
  {
    advanceSmoothTransition();
  }
  else
  {
    alignGradually(-orientingDirection_, dt);
  }
  lastAppliedDirection_ = orientingDirection_;
}

void GravityResolver::alignGradually(const Coordinate& targetUp, double dt)
{
  if (body_ == nullptr)
  {
    return;
  }
  const Eigen::Quaterniond target = computeTargetOrientation(targetUp);
  body_->setOrientation(VectorMath::slerpClamped(
    body_->getOrientation(), target, config_.gradualAlignmentSpeed * dt));
}

Eigen::Quaterniond GravityResolver::computeTargetOrientation(
  const Coordinate& newUp) const
{
  const Coordinate up = VectorMath::safeNormalized(newUp, -worldDown_);
  const Eigen::Quaterniond orientation =
    body_ != nullptr ? body_->getOrientation() : Eigen::Quaterniond::Identity();

  const Coordinate forward{orientation * Eigen::Vector3d::UnitZ()};
  const Coordinate projected = VectorMath::projectOnPlane(forward, up);
  if (projected.norm() < VectorMath::kMinDirectionNorm)
  {
    // Forward lies along the new up; rotate the current frame by the
    // shortest arc instead
    const Coordinate currentUp{orientation * Eigen::Vector3d::UnitY()};
    return (VectorMath::fromToRotation(currentUp, up) * orientation)
      .normalized();
  }
  return VectorMath::lookRotation(projected, up);
}

bool GravityResolver::isBigChange(const Coordinate& from,
                                  const Coordinate& to) const
{
  return from.dot(to) < config_.directionChangeDot;
}

void GravityResolver::forceAlign(bool useTransition)
{
  const Coordinate& target =
    (inSpace_ && config_.maintainOrientationInSpace) ? lastValidDirection_
                                                     : orientingDirection_;

  if (target.isExactlyZero())
  {
    spdlog::debug("GravityResolver: no orienting direction, alignment skipped");
    return;
  }
  if (!isBigChange(lastAppliedDirection_, target))
  {
    spdlog::debug("GravityResolver: down {} unchanged, alignment skipped",
                  target);
    return;
  }
  if (dashActive_)
  {
    spdlog::debug("GravityResolver: alignment to {} deferred until dash ends",
                  target);
    return;
  }

  if (useTransition && config_.useGradualTransitions)
  {
    beginSmoothTransition(target);
  }
  else
  {
    snapTo(target);
  }
}

void GravityResolver::snapTo(const Coordinate& direction)
{
  const Coordinate from = lastAppliedDirection_;
  const Coordinate to = direction;

  abandonSmoothTransition();
  if (body_ != nullptr)
  {
    body_->setOrientation(computeTargetOrientation(-to));
  }
  lastAppliedDirection_ = to;

  orientationState_ = OrientationState::Transitioning;
  transitionStart_ = simTime_;
  transitionDeadline_ = simTime_ + config_.transitionGraceWindow;

  spdlog::debug("GravityResolver: snapped down {} -> {}", from, to);
  notifyGravityChanged(from, to, 0.0);
  notifyTransitionCompleted(from, to, 0.0);
}

void GravityResolver::beginSmoothTransition(const Coordinate& direction)
{
  const double duration = 1.0 / config_.gravityTransitionSpeed;
  const Eigen::Quaterniond start =
    body_ != nullptr ? body_->getOrientation() : Eigen::Quaterniond::Identity();

  SmoothTransition transition{start,
                              computeTargetOrientation(-direction),
                              simTime_,
                              duration,
                              lastAppliedDirection_,
                              direction};
  abandonSmoothTransition();
  smoothTransition_ = transition;
  lastAppliedDirection_ = direction;

  orientationState_ = OrientationState::Transitioning;
  transitionStart_ = simTime_;
  transitionDeadline_ = simTime_ + duration;

  spdlog::debug("GravityResolver: transition down {} -> {} over {} s",
                transition.fromDirection,
                transition.toDirection,
                duration);
  notifyGravityChanged(transition.fromDirection, transition.toDirection,
                       duration);
}

void GravityResolver::advanceSmoothTransition()
{
  if (!smoothTransition_ || body_ == nullptr)
  {
    return;
  }
  const double progress =
    (simTime_ - smoothTransition_->startTime) / smoothTransition_->duration;
  body_->setOrientation(VectorMath::slerpClamped(
    smoothTransition_->startOrientation,
    smoothTransition_->targetOrientation,
    progress));
}

void GravityResolver::finishTransition()
{
  orientationState_ = OrientationState::Stable;
  if (!smoothTransition_)
  {
    return;
  }

  const SmoothTransition finished = *smoothTransition_;
  smoothTransition_.reset();
  if (body_ != nullptr)
  {
    body_->setOrientation(finished.targetOrientation);
  }
  notifyTransitionCompleted(
    finished.fromDirection, finished.toDirection, finished.duration);
}

void GravityResolver::abandonSmoothTransition()
{
  if (!smoothTransition_)
  {
    return;
  }
  const SmoothTransition abandoned = *smoothTransition_;
  smoothTransition_.reset();
  spdlog::debug("GravityResolver: transition to {} superseded",
                abandoned.toDirection);
  notifyTransitionCompleted(
    abandoned.fromDirection, abandoned.toDirection, abandoned.duration);
}

void GravityResolver::expireTransition()
{
  if (orientationState_ == OrientationState::Transitioning &&
      simTime_ >= transitionDeadline_)
  {
    finishTransition();
  }
}

void GravityResolver::completeTransition()
{
  if (orientationState_ == OrientationState::Stable)
  {
    return;
  }
  finishTransition();
}

void GravityResolver::preserveWorldForward(const Coordinate& worldForward)
{
  if (body_ == nullptr)
  {
    return;
  }
  const Coordinate up = body_->getUp();
  const Coordinate projected = VectorMath::projectOnPlane(worldForward, up);
  if (projected.norm() < VectorMath::kMinDirectionNorm)
  {
    spdlog::debug("GravityResolver: forward {} parallel to up, ignored",
                  worldForward);
    return;
  }
  body_->setOrientation(VectorMath::lookRotation(projected, up));
}

void GravityResolver::setSpaceGravityDirection(const Coordinate& direction)
{
  const Coordinate normalized = VectorMath::normalizedOrZero(direction);
  if (normalized.isExactlyZero())
  {
    spdlog::warn("GravityResolver: ignoring degenerate space direction {}",
                 direction);
    return;
  }
  lastValidDirection_ = normalized;
  if (inSpace_)
  {
    spaceSteering_ = true;
  }
}

// ===== Queries =====

Coordinate GravityResolver::getEffectiveDirection() const
{
  if (!gravityDirection_.isExactlyZero())
  {
    return gravityDirection_;
  }
  if (!lastValidDirection_.isExactlyZero())
  {
    return lastValidDirection_;
  }
  return worldDown_;
}

Coordinate GravityResolver::getGravityUp() const
{
  return Coordinate{-getEffectiveDirection()};
}

std::optional<Coordinate> GravityResolver::getCommandedUp() const
{
  if (inSpace_)
  {
    if (config_.maintainOrientationInSpace)
    {
      return Coordinate{-lastValidDirection_};
    }
    return std::nullopt;
  }
  if (orientingDirection_.isExactlyZero())
  {
    return std::nullopt;
  }
  return Coordinate{-orientingDirection_};
}

double GravityResolver::getTransitionProgress() const
{
  if (orientationState_ == OrientationState::Stable)
  {
    return 1.0;
  }
  const double window = transitionDeadline_ - transitionStart_;
  if (window <= 0.0)
  {
    return 1.0;
  }
  return std::clamp((simTime_ - transitionStart_) / window, 0.0, 1.0);
}

bool GravityResolver::isNormalWalkable(const Coordinate& normal,
                                       double maxSlopeDeg) const
{
  const Coordinate n = VectorMath::normalizedOrZero(normal);
  if (n.isExactlyZero())
  {
    return false;
  }
  const double minDot = std::cos(maxSlopeDeg * std::numbers::pi / 180.0);
  return n.dot(getGravityUp()) >= minDot;
}

// ===== Observers =====

GravityResolver::ListenerId GravityResolver::addGravityChangedListener(
  GravityChangedListener listener)
{
  if (!listener)
  {
    return 0;
  }
  const ListenerId id = nextListenerId_++;
  changedListeners_.emplace_back(id, std::move(listener));
  return id;
}

GravityResolver::ListenerId GravityResolver::addTransitionCompletedListener(
  GravityChangedListener listener)
{
  if (!listener)
  {
    return 0;
  }
  const ListenerId id = nextListenerId_++;
  completedListeners_.emplace_back(id, std::move(listener));
  return id;
}

GravityResolver::ListenerId GravityResolver::addSpaceTransitionListener(
  SpaceTransitionListener listener)
{
  if (!listener)
  {
    return 0;
  }
  const ListenerId id = nextListenerId_++;
  spaceListeners_.emplace_back(id, std::move(listener));
  return id;
}

bool GravityResolver::removeListener(ListenerId id)
{
  auto matches = [id](const auto& entry) { return entry.first == id; };
  return std::erase_if(changedListeners_, matches) > 0 ||
         std::erase_if(completedListeners_, matches) > 0 ||
         std::erase_if(spaceListeners_, matches) > 0;
}

void GravityResolver::notifyGravityChanged(const Coordinate& from,
                                           const Coordinate& to,
                                           double duration) const
{
  // Snapshot so callbacks may unregister themselves
  const auto listeners = changedListeners_;
  for (const auto& [id, listener] : listeners)
  {
    listener(from, to, duration);
  }
}

void GravityResolver::notifyTransitionCompleted(const Coordinate& from,
                                                const Coordinate& to,
                                                double duration) const
{
  const auto listeners = completedListeners_;
  for (const auto& [id, listener] : listeners)
  {
    listener(from, to, duration);
  }
}

void GravityResolver::notifySpaceTransition(bool entering,
                                            const Coordinate& direction) const
{
  const auto listeners = spaceListeners_;
  for (const auto& [id, listener] : listeners)
  {
    listener(entering, direction);
  }
}

}  // namespace orb_sim
