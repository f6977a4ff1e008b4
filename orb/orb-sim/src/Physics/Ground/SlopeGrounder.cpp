// Ticket: 0007_slope_grounding

#include "orb-sim/src/Physics/Ground/SlopeGrounder.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <string>

#include "orb-sim/src/DataTypes/Vec3FormatterBase.hpp"
#include "orb-sim/src/DataTypes/Velocity.hpp"
#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"
#include "orb-sim/src/Physics/Ground/GroundProbe.hpp"
#include "orb-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "orb-sim/src/Utils/VectorMath.hpp"

namespace orb_sim
{

namespace
{

void requireAtLeast(double value, double minimum, const char* field)
{
  if (value < minimum)
  {
    throw std::invalid_argument(std::string{"SlopeGrounder: "} + field +
                                " must be >= " + std::to_string(minimum) +
                                ", got: " + std::to_string(value));
  }
}

}  // namespace

void SlopeGrounder::Config::validate() const
{
  requireAtLeast(probeRadius, 0.01, "probeRadius");
  requireAtLeast(probeDistance, 0.02, "probeDistance");
  requireAtLeast(probeStartOffset, 0.0, "probeStartOffset");
  requireAtLeast(stickAccel, 0.0, "stickAccel");
  requireAtLeast(downhillBrakeAccel, 0.0, "downhillBrakeAccel");
  requireAtLeast(downhillDeadzone, 0.0, "downhillDeadzone");
  if (maxSlopeAngleDeg < 0.0 || maxSlopeAngleDeg > 89.9)
  {
    throw std::invalid_argument(
      "SlopeGrounder: maxSlopeAngleDeg must be in [0, 89.9], got: " +
      std::to_string(maxSlopeAngleDeg));
  }
}

SlopeGrounder::SlopeGrounder(RigidBody* body,
                             const GravityResolver* resolver,
                             const GroundProbe* probe,
                             Config config)
  : body_{body}, resolver_{resolver}, probe_{probe}, config_{config}
{
  config_.validate();
}

SlopeGrounder::SlopeGrounder(RigidBody* body,
                             const GravityResolver* resolver,
                             const GroundProbe* probe)
  : SlopeGrounder{body, resolver, probe, Config{}}
{
}

void SlopeGrounder::probeGround(const Coordinate& up)
{
  grounded_ = false;
  groundNormal_ = up;
  groundAngleDeg_ = 180.0;

  if (probe_ == nullptr)
  {
    return;
  }

  const Coordinate down{-up};
  const Coordinate origin{body_->getPosition() + up * config_.probeStartOffset};
  const double castDistance = config_.probeDistance + config_.probeRadius;

  auto hit = probe_->sphereCast(origin, config_.probeRadius, down, castDistance);
  if (!hit)
  {
    // The sphere can miss when it starts right at the contact
    hit = probe_->rayCast(origin, down, castDistance);
  }
  if (!hit)
  {
    return;
  }

  const Coordinate normal = VectorMath::normalizedOrZero(hit->normal);
  if (normal.isExactlyZero())
  {
    spdlog::warn("SlopeGrounder: probe returned degenerate normal {}",
                 hit->normal);
    return;
  }
  if (normal.dot(up) < 0.0)
  {
    return;
  }

  grounded_ = true;
  groundNormal_ = normal;
  groundAngleDeg_ = VectorMath::angleBetweenDeg(normal, up);
}

void SlopeGrounder::update(double dt)
{
  if (body_ == nullptr || resolver_ == nullptr)
  {
    grounded_ = false;
    return;
  }

  const Coordinate up = resolver_->getGravityUp();
  const Coordinate down{-up};
  probeGround(up);

  if (!grounded_)
  {
    return;
  }

  Coordinate v{body_->getVelocity()};

  if (config_.killUpwardWhenGrounded)
  {
    const double upSpeed = v.dot(up);
    if (upSpeed > 0.0)
    {
      v -= up * upSpeed;
    }
  }

  if (resolver_->isNormalWalkable(groundNormal_, config_.maxSlopeAngleDeg))
  {
    v = VectorMath::projectOnPlane(v, groundNormal_);
    v += down * (config_.stickAccel * dt);

    if (config_.preventGentleSlide && config_.downhillBrakeAccel > 0.0)
    {
      const Coordinate downhill = VectorMath::normalizedOrZero(
        VectorMath::projectOnPlane(down, groundNormal_));
      if (!downhill.isExactlyZero())
      {
        const double downhillSpeed = v.dot(downhill);
        if (downhillSpeed > config_.downhillDeadzone)
        {
          const double braked = std::max(
            0.0, downhillSpeed - config_.downhillBrakeAccel * dt);
          v += downhill * (braked - downhillSpeed);
        }
      }
    }
  }
  else
  {
    if (config_.blockClimbOnSteep)
    {
      const Coordinate uphill = VectorMath::normalizedOrZero(
        VectorMath::projectOnPlane(up, groundNormal_));
      const double uphillSpeed = v.dot(uphill);
      if (uphillSpeed > 0.0)
      {
        v -= uphill * uphillSpeed;
      }
    }
    v += down * (0.5 * config_.stickAccel * dt);
  }

  body_->setVelocity(Velocity{v});
}

}  // namespace orb_sim
