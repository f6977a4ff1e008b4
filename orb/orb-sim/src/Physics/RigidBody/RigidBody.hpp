// Ticket: 0003_rigid_body_state

#ifndef ORB_SIM_RIGID_BODY_HPP
#define ORB_SIM_RIGID_BODY_HPP

#include <Eigen/Geometry>

#include "orb-sim/src/DataTypes/Acceleration.hpp"
#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/DataTypes/Velocity.hpp"
#include "orb-sim/src/Physics/RigidBody/InertialState.hpp"

namespace orb_sim
{

/**
 * @brief Orientable point-mass body driven by the gravity components
 *
 * Collects accelerations from any number of contributors during a step
 * (gravity, extra fall gravity, movement) and hands their sum to the
 * integrator. Velocity changes are applied immediately.
 *
 * The body is the single shared resource of a character: the resolver
 * writes orientation and gravity acceleration, the slope grounder and the
 * gravity modifier reshape velocity, the integrator advances position.
 *
 * Thread safety: Not thread-safe (single-threaded simulation assumed)
 *
 * @ticket 0003_rigid_body_state
 */
class RigidBody
{
public:
  /**
   * @brief Construct a body at rest
   * @param mass Mass [kg]
   * @param position Initial world position
   * @param orientation Initial orientation (normalized on construction)
   * @throws std::invalid_argument if mass <= 0
   */
  explicit RigidBody(double mass,
                     const Coordinate& position = Coordinate{},
                     const Eigen::Quaterniond& orientation =
                       Eigen::Quaterniond::Identity());

  ~RigidBody() = default;

  RigidBody(const RigidBody&) = default;
  RigidBody& operator=(const RigidBody&) = default;
  RigidBody(RigidBody&&) noexcept = default;
  RigidBody& operator=(RigidBody&&) noexcept = default;

  /**
   * @brief Accumulate an acceleration for the next integration step
   * @param acceleration World-frame acceleration [m/s^2]
   */
  void applyAcceleration(const Acceleration& acceleration);

  /**
   * @brief Change the velocity immediately
   * @param deltaV World-frame velocity change [m/s]
   */
  void applyVelocityChange(const Velocity& deltaV);

  /**
   * @brief Take the accumulated acceleration and reset the accumulator
   * @return Sum of all accelerations applied since the last call
   */
  Acceleration consumeAccumulatedAcceleration();

  [[nodiscard]] const Acceleration& getAccumulatedAcceleration() const
  {
    return accumulatedAcceleration_;
  }

  [[nodiscard]] const InertialState& getInertialState() const
  {
    return state_;
  }

  InertialState& getInertialState()
  {
    return state_;
  }

  [[nodiscard]] const Coordinate& getPosition() const
  {
    return state_.position;
  }

  void setPosition(const Coordinate& position)
  {
    state_.position = position;
  }

  [[nodiscard]] const Velocity& getVelocity() const
  {
    return state_.velocity;
  }

  void setVelocity(const Velocity& velocity)
  {
    state_.velocity = velocity;
  }

  [[nodiscard]] const Eigen::Quaterniond& getOrientation() const
  {
    return state_.orientation;
  }

  /**
   * @brief Set the orientation (normalized before storing)
   */
  void setOrientation(const Eigen::Quaterniond& orientation);

  [[nodiscard]] Coordinate getUp() const
  {
    return state_.getUp();
  }

  [[nodiscard]] Coordinate getForward() const
  {
    return state_.getForward();
  }

  [[nodiscard]] double getMass() const
  {
    return mass_;
  }

  /**
   * @brief Update the mass
   * @throws std::invalid_argument if mass <= 0
   */
  void setMass(double mass);

private:
  double mass_;
  InertialState state_;
  Acceleration accumulatedAcceleration_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_RIGID_BODY_HPP
