// Ticket: 0008_fall_gravity

#ifndef ORB_SIM_PHYSICS_GRAVITY_MODIFIER_HPP
#define ORB_SIM_PHYSICS_GRAVITY_MODIFIER_HPP

namespace orb_sim
{

class GravityResolver;
class RigidBody;
class SlopeGrounder;

/**
 * @brief Heavier gravity while falling and a terminal fall speed
 *
 * Airborne and not dashing, the body gets extra acceleration along the
 * resolver's gravity direction on top of what the resolver already applies:
 * (multiplier - 1) * gravityMagnitude, where the multiplier depends on the
 * speed along gravity. Independently, speed along gravity above
 * terminalVelocity is removed with an immediate velocity change.
 *
 * Does nothing while the resolver is in space.
 *
 * @ticket 0008_fall_gravity
 */
class GravityModifier
{
public:
  struct Config
  {
    double baseMultiplier{1.0};
    double fallingMultiplier{1.5};      // Speed along gravity > fallingThreshold
    double fastFallingMultiplier{2.0};  // Speed along gravity > fastFallThreshold
    double fallingThreshold{0.1};       // [m/s]
    double fastFallThreshold{8.0};      // [m/s]
    double terminalVelocity{50.0};      // [m/s]

    /**
     * @throws std::invalid_argument naming the offending field
     */
    void validate() const;
  };

  /**
   * @param body Body to act on (non-owning)
   * @param resolver Source of the gravity direction (non-owning)
   * @param grounder Ground state; null means always airborne (non-owning)
   * @param config Tunables
   * @throws std::invalid_argument if config fails validation
   */
  GravityModifier(RigidBody* body,
                  const GravityResolver* resolver,
                  const SlopeGrounder* grounder,
                  Config config);

  GravityModifier(RigidBody* body,
                  const GravityResolver* resolver,
                  const SlopeGrounder* grounder);

  /**
   * @brief Apply extra fall gravity and the terminal velocity clamp
   */
  void update();

  /**
   * @brief Multiplier chosen by the last update(); 1 when none applied
   */
  [[nodiscard]] double getLastMultiplier() const
  {
    return lastMultiplier_;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  RigidBody* body_;
  const GravityResolver* resolver_;
  const SlopeGrounder* grounder_;
  Config config_;
  double lastMultiplier_{1.0};
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_GRAVITY_MODIFIER_HPP
