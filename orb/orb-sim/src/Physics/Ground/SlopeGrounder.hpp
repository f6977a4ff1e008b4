// Ticket: 0007_slope_grounding

#ifndef ORB_SIM_PHYSICS_SLOPE_GROUNDER_HPP
#define ORB_SIM_PHYSICS_SLOPE_GROUNDER_HPP

#include "orb-sim/src/DataTypes/Coordinate.hpp"

namespace orb_sim
{

class GravityResolver;
class GroundProbe;
class RigidBody;

/**
 * @brief Reshapes a body's velocity so it respects slope limits
 *
 * Runs after the movement code each step. "Ground" is defined by the
 * resolver's gravity up, so the rules hold on walls and ceilings as well.
 *
 * - Walkable ground (angle to up <= maxSlopeAngleDeg): velocity is projected
 *   onto the surface, pushed into it, and slow downhill drift is braked.
 * - Steep ground: uphill motion is removed and a weaker push into the
 *   surface keeps contact.
 * - Airborne: velocity is left untouched.
 *
 * The grounder does not read input and never throws after construction;
 * missing collaborators leave the body airborne and untouched.
 *
 * @ticket 0007_slope_grounding
 */
class SlopeGrounder
{
public:
  struct Config
  {
    double probeRadius{0.25};       // Sphere probe radius [m]
    double probeDistance{0.6};      // Search depth below the feet [m]
    double probeStartOffset{0.05};  // Probe starts this far above [m]
    double maxSlopeAngleDeg{46.0};  // Walkable limit, in [0, 89.9]
    bool blockClimbOnSteep{true};
    double stickAccel{25.0};  // Push into the ground [m/s^2]
    bool killUpwardWhenGrounded{true};
    bool preventGentleSlide{true};
    double downhillBrakeAccel{20.0};  // [m/s^2]
    double downhillDeadzone{0.05};    // Drift below this is ignored [m/s]

    /**
     * @throws std::invalid_argument naming the offending field
     */
    void validate() const;
  };

  /**
   * @param body Body whose velocity is reshaped (non-owning)
   * @param resolver Source of gravity up (non-owning)
   * @param probe Scene query (non-owning)
   * @param config Tunables
   * @throws std::invalid_argument if config fails validation
   */
  SlopeGrounder(RigidBody* body,
                const GravityResolver* resolver,
                const GroundProbe* probe,
                Config config);

  SlopeGrounder(RigidBody* body,
                const GravityResolver* resolver,
                const GroundProbe* probe);

  /**
   * @brief Probe the ground and adjust the body's velocity
   * @param dt Timestep [s]
   */
  void update(double dt);

  [[nodiscard]] bool isGrounded() const
  {
    return grounded_;
  }

  /**
   * @brief Unit normal of the ground, or gravity up when airborne
   */
  [[nodiscard]] const Coordinate& getGroundNormal() const
  {
    return groundNormal_;
  }

  /**
   * @brief Angle between ground normal and gravity up [deg]; 180 airborne
   */
  [[nodiscard]] double getGroundAngleDeg() const
  {
    return groundAngleDeg_;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  void setProbe(const GroundProbe* probe)
  {
    probe_ = probe;
  }

private:
  void probeGround(const Coordinate& up);

  RigidBody* body_;
  const GravityResolver* resolver_;
  const GroundProbe* probe_;
  Config config_;

  bool grounded_{false};
  Coordinate groundNormal_{0.0, 1.0, 0.0};
  double groundAngleDeg_{180.0};
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_SLOPE_GROUNDER_HPP
