// Ticket: 0003_rigid_body_state

#include "orb-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

#include <Eigen/Geometry>

namespace orb_sim
{

void SemiImplicitEulerIntegrator::step(InertialState& state,
                                       const Acceleration& acceleration,
                                       double dt) const
{
  state.acceleration = acceleration;

  // Update velocity: v_new = v_old + a * dt
  state.velocity += acceleration * dt;

  // Update position using NEW velocity: x_new = x_old + v_new * dt
  state.position += state.velocity * dt;

  // Rotate by |ω|·dt about ω (world frame, so pre-multiply)
  const double angle = state.angularVelocity.norm() * dt;
  if (angle > 0.0)
  {
    const Eigen::AngleAxisd delta{angle, state.angularVelocity.normalized()};
    state.orientation = Eigen::Quaterniond{delta} * state.orientation;
  }

  // Keep |Q| = 1 within machine precision
  state.orientation.normalize();
}

}  // namespace orb_sim
