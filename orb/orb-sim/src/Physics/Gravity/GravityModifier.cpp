// Ticket: 0008_fall_gravity

#include "orb-sim/src/Physics/Gravity/GravityModifier.hpp"

#include <stdexcept>
#include <string>

#include "orb-sim/src/DataTypes/Acceleration.hpp"
#include "orb-sim/src/DataTypes/Velocity.hpp"
#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"
#include "orb-sim/src/Physics/Ground/SlopeGrounder.hpp"
#include "orb-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "orb-sim/src/Utils/VectorMath.hpp"

namespace orb_sim
{

void GravityModifier::Config::validate() const
{
  if (baseMultiplier < 0.0 || fallingMultiplier < 0.0 ||
      fastFallingMultiplier < 0.0)
  {
    throw std::invalid_argument(
      "GravityModifier: multipliers must be non-negative");
  }
  if (fallingThreshold < 0.0 || fastFallThreshold < fallingThreshold)
  {
    throw std::invalid_argument(
      "GravityModifier: need 0 <= fallingThreshold <= fastFallThreshold, "
      "got: " +
      std::to_string(fallingThreshold) + ", " +
      std::to_string(fastFallThreshold));
  }
  if (terminalVelocity <= 0.0)
  {
    throw std::invalid_argument(
      "GravityModifier: terminalVelocity must be positive, got: " +
      std::to_string(terminalVelocity));
  }
}

GravityModifier::GravityModifier(RigidBody* body,
                                 const GravityResolver* resolver,
                                 const SlopeGrounder* grounder,
                                 Config config)
  : body_{body}, resolver_{resolver}, grounder_{grounder}, config_{config}
{
  config_.validate();
}

GravityModifier::GravityModifier(RigidBody* body,
                                 const GravityResolver* resolver,
                                 const SlopeGrounder* grounder)
  : GravityModifier{body, resolver, grounder, Config{}}
{
}

void GravityModifier::update()
{
  lastMultiplier_ = 1.0;
  if (body_ == nullptr || resolver_ == nullptr)
  {
    return;
  }

  const Coordinate gravityDir =
    VectorMath::normalizedOrZero(resolver_->getGravityDirection());
  if (gravityDir.isExactlyZero())
  {
    return;
  }

  const bool grounded = grounder_ != nullptr && grounder_->isGrounded();
  if (!grounded && !resolver_->isDashActive())
  {
    // Positive when moving with gravity
    const double fallSpeed = body_->getVelocity().dot(gravityDir);

    double multiplier = config_.baseMultiplier;
    if (fallSpeed > config_.fallingThreshold)
    {
      multiplier = fallSpeed > config_.fastFallThreshold
                     ? config_.fastFallingMultiplier
                     : config_.fallingMultiplier;
    }
    lastMultiplier_ = multiplier;

    const double extra = resolver_->getGravityMagnitude() * (multiplier - 1.0);
    if (extra > 0.0)
    {
      body_->applyAcceleration(Acceleration{gravityDir * extra});
    }
  }

  const double alongGravity = body_->getVelocity().dot(gravityDir);
  if (alongGravity > config_.terminalVelocity)
  {
    body_->applyVelocityChange(
      Velocity{gravityDir * -(alongGravity - config_.terminalVelocity)});
  }
}

}  // namespace orb_sim
