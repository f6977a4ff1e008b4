// Ticket: 0003_rigid_body_state

#ifndef ORB_SIM_PHYSICS_INTEGRATOR_HPP
#define ORB_SIM_PHYSICS_INTEGRATOR_HPP

#include "orb-sim/src/DataTypes/Acceleration.hpp"
#include "orb-sim/src/Physics/RigidBody/InertialState.hpp"

namespace orb_sim
{

/**
 * @brief Abstract interface for numerical integration of body kinematics
 *
 * Decouples the integration scheme from the gravity and grounding logic so
 * that WorldModel stays a pure orchestrator.
 *
 * Thread safety: Implementations should be stateless and thread-safe
 *
 * @ticket 0003_rigid_body_state
 */
class Integrator
{
public:
  virtual ~Integrator() = default;

  /**
   * @brief Integrate state forward by one timestep
   * @param state Current inertial state (modified in place)
   * @param acceleration Net world-frame acceleration for this step [m/s^2]
   * @param dt Timestep [s]
   */
  virtual void step(InertialState& state,
                    const Acceleration& acceleration,
                    double dt) const = 0;

protected:
  Integrator() = default;
  Integrator(const Integrator&) = default;
  Integrator& operator=(const Integrator&) = default;
  Integrator(Integrator&&) noexcept = default;
  Integrator& operator=(Integrator&&) noexcept = default;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_INTEGRATOR_HPP
