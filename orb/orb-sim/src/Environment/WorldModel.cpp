// Ticket: 0009_world_orchestration

#include "orb-sim/src/Environment/WorldModel.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace orb_sim
{

void WorldModel::update(std::chrono::milliseconds simTime)
{
  if (simTime <= time_)
  {
    spdlog::warn("WorldModel: ignoring update to {} ms, already at {} ms",
                 simTime.count(),
                 time_.count());
    return;
  }

  const double dt = std::chrono::duration<double>(simTime - time_).count();
  const double now = std::chrono::duration<double>(simTime).count();
  time_ = simTime;

  for (auto& actor : actors_)
  {
    updateMembership(*actor, now);
  }

  for (auto& area : areas_)
  {
    area->update(now);
  }

  for (auto& actor : actors_)
  {
    actor->step(dt, integrator_);
  }
}

void WorldModel::updateMembership(Actor& actor, double now)
{
  auto& inside = containment_[actor.getId()];
  const Coordinate& position = actor.getBody().getPosition();

  for (auto& area : areas_)
  {
    const bool contains = area->contains(position);
    const bool wasInside = inside.contains(area.get());
    if (contains && !wasInside)
    {
      inside.insert(area.get());
      area->onBodyEntered(actor.getResolver(), now);
    }
    else if (!contains && wasInside)
    {
      inside.erase(area.get());
      area->onBodyExited(actor.getResolver(), now);
    }
  }
}

GravityArea& WorldModel::addArea(std::unique_ptr<GravityArea> area)
{
  if (!area)
  {
    throw std::invalid_argument("WorldModel: cannot add a null gravity area");
  }
  spdlog::debug("WorldModel: added gravity area '{}' (priority {})",
                area->getName(),
                area->getPriority());
  areas_.push_back(std::move(area));
  return *areas_.back();
}

size_t WorldModel::addGroundPatch(const GroundPatch& patch)
{
  return ground_.addPatch(patch);
}

Actor& WorldModel::spawnActor(const Coordinate& position,
                              const Eigen::Quaterniond& orientation,
                              const Actor::Config& config)
{
  const uint32_t id = nextActorId_;
  actors_.push_back(
    std::make_unique<Actor>(id, position, orientation, &ground_, config));
  ++nextActorId_;
  return *actors_.back();
}

bool WorldModel::removeActor(uint32_t id)
{
  auto it = std::find_if(actors_.begin(),
                         actors_.end(),
                         [id](const std::unique_ptr<Actor>& actor)
                         { return actor->getId() == id; });
  if (it == actors_.end())
  {
    return false;
  }

  for (auto& area : areas_)
  {
    area->forgetBody((*it)->getResolver());
  }
  containment_.erase(id);
  actors_.erase(it);
  return true;
}

Actor* WorldModel::getActor(uint32_t id)
{
  auto it = std::find_if(actors_.begin(),
                         actors_.end(),
                         [id](const std::unique_ptr<Actor>& actor)
                         { return actor->getId() == id; });
  return it != actors_.end() ? it->get() : nullptr;
}

const Actor* WorldModel::getActor(uint32_t id) const
{
  auto it = std::find_if(actors_.begin(),
                         actors_.end(),
                         [id](const std::unique_ptr<Actor>& actor)
                         { return actor->getId() == id; });
  return it != actors_.end() ? it->get() : nullptr;
}

}  // namespace orb_sim
