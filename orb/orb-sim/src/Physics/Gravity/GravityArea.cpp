// Ticket: 0005_gravity_areas

#include "orb-sim/src/Physics/Gravity/GravityArea.hpp"

#include <utility>

#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"

namespace orb_sim
{

GravityArea::GravityArea(std::string name, int priority, AreaMode mode)
  : name_{std::move(name)}, priority_{priority}, mode_{mode}
{
}

void GravityArea::onBodyEntered(GravityResolver& body, double /*now*/)
{
  attach(body);
}

void GravityArea::onBodyExited(GravityResolver& body, double /*now*/)
{
  detach(body);
}

void GravityArea::update(double /*now*/)
{
}

void GravityArea::forgetBody(GravityResolver& /*body*/)
{
}

void GravityArea::attach(GravityResolver& body) const
{
  if (mode_ == AreaMode::FixedDirection)
  {
    body.addFixedDirectionSource(this);
  }
  else
  {
    body.addZone(this);
  }
}

void GravityArea::detach(GravityResolver& body) const
{
  if (mode_ == AreaMode::FixedDirection)
  {
    body.removeFixedDirectionSource(this);
  }
  else
  {
    body.removeZone(this);
  }
}

}  // namespace orb_sim
