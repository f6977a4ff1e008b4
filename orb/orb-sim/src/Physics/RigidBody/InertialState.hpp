// Ticket: 0003_rigid_body_state

#ifndef ORB_SIM_INERTIAL_STATE_HPP
#define ORB_SIM_INERTIAL_STATE_HPP

#include <Eigen/Geometry>

#include "orb-sim/src/DataTypes/Acceleration.hpp"
#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/DataTypes/Velocity.hpp"

namespace orb_sim
{

/**
 * @brief Kinematic state of a body: linear components plus orientation
 *
 * Orientation is a unit quaternion mapping body axes to world axes. Body
 * convention: +Y is up, +Z is forward, +X is right.
 *
 * Angular velocity is stored directly in the world frame [rad/s]; gravity
 * alignment drives the orientation kinematically, so the angular velocity is
 * normally zero and only used by externally spun bodies.
 *
 * @ticket 0003_rigid_body_state
 */
struct InertialState
{
  // Linear components
  Coordinate position;
  Velocity velocity;
  Acceleration acceleration;

  // Angular components
  Eigen::Quaterniond orientation{1.0,
                                 0.0,
                                 0.0,
                                 0.0};  // Identity quaternion (w, x, y, z)
  Coordinate angularVelocity;           // ω in world frame [rad/s]

  /**
   * @brief Body +Y axis expressed in the world frame
   */
  [[nodiscard]] Coordinate getUp() const;

  /**
   * @brief Body +Z axis expressed in the world frame
   */
  [[nodiscard]] Coordinate getForward() const;

  /**
   * @brief Body +X axis expressed in the world frame
   */
  [[nodiscard]] Coordinate getRight() const;
};

}  // namespace orb_sim

#endif  // ORB_SIM_INERTIAL_STATE_HPP
