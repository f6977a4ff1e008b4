// Ticket: 0009_world_orchestration

#ifndef ORB_SIM_ENVIRONMENT_ACTOR_HPP
#define ORB_SIM_ENVIRONMENT_ACTOR_HPP

#include <Eigen/Geometry>
#include <cstdint>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/Gravity/GravityModifier.hpp"
#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"
#include "orb-sim/src/Physics/Ground/SlopeGrounder.hpp"
#include "orb-sim/src/Physics/RigidBody/RigidBody.hpp"

namespace orb_sim
{

class GroundProbe;
class Integrator;

/**
 * @brief A character: one body plus the components that shape its motion
 *
 * Owns the body and wires the resolver, grounder and modifier to it. The
 * components keep pointers to the body and to each other, so an actor is
 * pinned in memory once constructed.
 *
 * @ticket 0009_world_orchestration
 */
class Actor
{
public:
  struct Config
  {
    double mass{70.0};  // [kg]
    GravityResolver::Config gravity{};
    SlopeGrounder::Config grounding{};
    GravityModifier::Config fall{};
  };

  /**
   * @param id Identifier assigned by the world
   * @param position Initial feet position
   * @param orientation Initial orientation
   * @param probe Ground query shared by the world (non-owning, may be null)
   * @param config Per-component tunables
   * @throws std::invalid_argument if any part of config is invalid
   */
  Actor(uint32_t id,
        const Coordinate& position,
        const Eigen::Quaterniond& orientation,
        const GroundProbe* probe,
        const Config& config);

  Actor(uint32_t id,
        const Coordinate& position,
        const Eigen::Quaterniond& orientation,
        const GroundProbe* probe);

  ~Actor() = default;

  Actor(const Actor&) = delete;
  Actor& operator=(const Actor&) = delete;
  Actor(Actor&&) = delete;
  Actor& operator=(Actor&&) = delete;

  /**
   * @brief Advance one step: resolver, grounder, modifier, integration,
   *        then ground contact
   * @param dt Timestep [s]
   * @param integrator Integration scheme
   */
  void step(double dt, const Integrator& integrator);

  [[nodiscard]] uint32_t getId() const
  {
    return id_;
  }

  [[nodiscard]] const RigidBody& getBody() const
  {
    return body_;
  }

  RigidBody& getBody()
  {
    return body_;
  }

  [[nodiscard]] const GravityResolver& getResolver() const
  {
    return resolver_;
  }

  GravityResolver& getResolver()
  {
    return resolver_;
  }

  [[nodiscard]] const SlopeGrounder& getGrounder() const
  {
    return grounder_;
  }

  [[nodiscard]] const GravityModifier& getModifier() const
  {
    return modifier_;
  }

private:
  /// Stop the feet from passing through the ground during the last step
  void resolveGroundContact(const Coordinate& previousPosition);

  uint32_t id_;
  const GroundProbe* probe_;
  double contactSkin_;
  RigidBody body_;
  GravityResolver resolver_;
  SlopeGrounder grounder_;
  GravityModifier modifier_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_ENVIRONMENT_ACTOR_HPP
