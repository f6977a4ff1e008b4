// Ticket: 0009_world_orchestration

#ifndef ORB_SIM_WORLD_MODEL_HPP
#define ORB_SIM_WORLD_MODEL_HPP

#include <Eigen/Geometry>
#include <chrono>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "orb-sim/src/Environment/Actor.hpp"
#include "orb-sim/src/Physics/Gravity/GravityArea.hpp"
#include "orb-sim/src/Physics/Ground/PlanarGround.hpp"
#include "orb-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

namespace orb_sim
{

/**
 * @brief Owns the level (gravity areas, ground) and the actors in it
 *
 * Each update():
 * 1. Tests every actor's position against every area and reports entry and
 *    exit edges to the area.
 * 2. Lets areas finish postponed membership changes.
 * 3. Steps every actor (resolver, grounder, modifier, integration).
 *
 * Thread safety: Not thread-safe (single-threaded simulation assumed)
 *
 * @ticket 0009_world_orchestration
 */
class WorldModel
{
public:
  WorldModel() = default;
  ~WorldModel() = default;

  WorldModel(const WorldModel&) = delete;
  WorldModel& operator=(const WorldModel&) = delete;
  WorldModel(WorldModel&&) = delete;
  WorldModel& operator=(WorldModel&&) = delete;

  /**
   * @brief Advance the world to an absolute simulation time
   * @param simTime Absolute time (not a delta); values not after the current
   *        time are ignored with a warning
   */
  void update(std::chrono::milliseconds simTime);

  /**
   * @brief Take ownership of a gravity area
   * @return Reference to the stored area
   * @throws std::invalid_argument if area is null
   */
  GravityArea& addArea(std::unique_ptr<GravityArea> area);

  /**
   * @brief Construct a gravity area in place
   */
  template <typename AreaT, typename... Args>
  AreaT& emplaceArea(Args&&... args)
  {
    auto area = std::make_unique<AreaT>(std::forward<Args>(args)...);
    AreaT& ref = *area;
    addArea(std::move(area));
    return ref;
  }

  /**
   * @brief Add a flat ground patch
   * @throws std::invalid_argument if the patch is invalid
   */
  size_t addGroundPatch(const GroundPatch& patch);

  /**
   * @brief Create an actor standing at a position
   *
   * @param position Initial feet position
   * @param orientation Initial orientation
   * @param config Per-component tunables
   * @return Reference to the new actor; ids start at 1
   * @throws std::invalid_argument if config is invalid
   */
  Actor& spawnActor(const Coordinate& position,
                    const Eigen::Quaterniond& orientation =
                      Eigen::Quaterniond::Identity(),
                    const Actor::Config& config = Actor::Config{});

  /**
   * @brief Destroy an actor and make every area forget it
   * @return true if the actor existed
   */
  bool removeActor(uint32_t id);

  /**
   * @brief Look up an actor
   * @return Pointer to the actor, or nullptr if not found
   */
  [[nodiscard]] Actor* getActor(uint32_t id);
  [[nodiscard]] const Actor* getActor(uint32_t id) const;

  [[nodiscard]] const std::vector<std::unique_ptr<Actor>>& getActors() const
  {
    return actors_;
  }

  [[nodiscard]] const std::vector<std::unique_ptr<GravityArea>>& getAreas()
    const
  {
    return areas_;
  }

  [[nodiscard]] const PlanarGround& getGround() const
  {
    return ground_;
  }

  [[nodiscard]] std::chrono::milliseconds getTime() const
  {
    return time_;
  }

private:
  void updateMembership(Actor& actor, double now);

  PlanarGround ground_;
  SemiImplicitEulerIntegrator integrator_;
  std::vector<std::unique_ptr<GravityArea>> areas_;
  std::vector<std::unique_ptr<Actor>> actors_;

  // Actor id -> areas whose volume contained the actor last step
  std::unordered_map<uint32_t, std::unordered_set<const GravityArea*>>
    containment_;

  std::chrono::milliseconds time_{0};
  uint32_t nextActorId_{1};
};

}  // namespace orb_sim

#endif  // ORB_SIM_WORLD_MODEL_HPP
