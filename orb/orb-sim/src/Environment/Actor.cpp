// Ticket: 0009_world_orchestration

#include "orb-sim/src/Environment/Actor.hpp"

#include "orb-sim/src/DataTypes/Velocity.hpp"
#include "orb-sim/src/Physics/Ground/GroundProbe.hpp"
#include "orb-sim/src/Physics/Integration/Integrator.hpp"

namespace orb_sim
{

Actor::Actor(uint32_t id,
             const Coordinate& position,
             const Eigen::Quaterniond& orientation,
             const GroundProbe* probe,
             const Config& config)
  : id_{id},
    probe_{probe},
    contactSkin_{config.grounding.probeStartOffset},
    body_{config.mass, position, orientation},
    resolver_{&body_, config.gravity},
    grounder_{&body_, &resolver_, probe, config.grounding},
    modifier_{&body_, &resolver_, &grounder_, config.fall}
{
}

Actor::Actor(uint32_t id,
             const Coordinate& position,
             const Eigen::Quaterniond& orientation,
             const GroundProbe* probe)
  : Actor{id, position, orientation, probe, Config{}}
{
}

void Actor::step(double dt, const Integrator& integrator)
{
  resolver_.update(dt);
  grounder_.update(dt);
  modifier_.update();

  const Coordinate previousPosition = body_.getPosition();
  const Acceleration acceleration = body_.consumeAccumulatedAcceleration();
  integrator.step(body_.getInertialState(), acceleration, dt);

  resolveGroundContact(previousPosition);
}

void Actor::resolveGroundContact(const Coordinate& previousPosition)
{
  if (probe_ == nullptr)
  {
    return;
  }

  // Sweep from slightly above the previous feet position to the new one
  const Coordinate start{previousPosition + body_.getUp() * contactSkin_};
  const Coordinate travel{body_.getPosition() - start};
  const double length = travel.norm();
  if (length <= 0.0)
  {
    return;
  }

  const auto hit = probe_->rayCast(start, travel, length);
  if (!hit)
  {
    return;
  }

  body_.setPosition(hit->point);
  const double intoSurface = body_.getVelocity().dot(hit->normal);
  if (intoSurface < 0.0)
  {
    body_.setVelocity(
      Velocity{body_.getVelocity() - hit->normal * intoSurface});
  }
}

}  // namespace orb_sim
