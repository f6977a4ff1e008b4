// Ticket: 0003_rigid_body_state

#ifndef ORB_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
#define ORB_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP

#include "orb-sim/src/Physics/Integration/Integrator.hpp"

namespace orb_sim
{

/**
 * @brief Symplectic Euler: velocity first, then position with the new
 *        velocity
 *
 * Orientation integrates the world-frame angular velocity through the
 * exponential map and is renormalized every step.
 *
 * @ticket 0003_rigid_body_state
 */
class SemiImplicitEulerIntegrator final : public Integrator
{
public:
  SemiImplicitEulerIntegrator() = default;
  ~SemiImplicitEulerIntegrator() override = default;

  SemiImplicitEulerIntegrator(const SemiImplicitEulerIntegrator&) = default;
  SemiImplicitEulerIntegrator& operator=(const SemiImplicitEulerIntegrator&) =
    default;
  SemiImplicitEulerIntegrator(SemiImplicitEulerIntegrator&&) noexcept = default;
  SemiImplicitEulerIntegrator& operator=(
    SemiImplicitEulerIntegrator&&) noexcept = default;

  void step(InertialState& state,
            const Acceleration& acceleration,
            double dt) const override;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
