// Ticket: 0005_gravity_areas
// Ticket: 0006_deferred_zone_membership

#ifndef ORB_SIM_PHYSICS_GRAVITY_BOX_HPP
#define ORB_SIM_PHYSICS_GRAVITY_BOX_HPP

#include <Eigen/Geometry>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/Gravity/GravityArea.hpp"

namespace orb_sim
{

/**
 * @brief Local face of a box that acts as the floor
 *
 * Gravity points towards the chosen face: Down pulls along the box's -Y,
 * Up along +Y, Right along +X, Left along -X, Forward along +Z, Back along -Z.
 */
enum class FaceDirection : uint8_t
{
  Up,
  Down,
  Left,
  Right,
  Forward,
  Back
};

/**
 * @brief Unit vector towards a box face in the box's local frame
 */
[[nodiscard]] Eigen::Vector3d localFaceDirection(FaceDirection face);

/**
 * @brief Whether a world point lies inside an oriented box
 * @param center World-space centre
 * @param halfExtents Half size along the box's local axes [m]
 * @param orientation Unit box orientation in world space
 * @param point World-space point
 */
[[nodiscard]] bool orientedBoxContains(const Coordinate& center,
                                       const Coordinate& halfExtents,
                                       const Eigen::Quaterniond& orientation,
                                       const Coordinate& point);

/**
 * @brief Oriented box whose chosen face is "down", with delayed membership
 *
 * Entering or leaving the box takes effect only after gravityChangeDelay
 * seconds. Crossing back before the delay elapses cancels the pending change,
 * so a body skimming the boundary does not flip back and forth. Every
 * postponed change is registered with the resolver's safety timeout, and a
 * completed exit forces the body to re-align with whatever gravity remains.
 *
 * @ticket 0005_gravity_areas
 */
class GravityBox final : public GravityArea
{
public:
  struct Config
  {
    double gravityChangeDelay{0.5};  // [s]
    AreaMode mode{AreaMode::Orienting};

    /**
     * @throws std::invalid_argument if gravityChangeDelay is negative
     */
    void validate() const;
  };

  /**
   * @brief Construct a gravity box
   *
   * @param name Name used in log output
   * @param priority Priority among overlapping sources
   * @param center World-space centre
   * @param halfExtents Half size along the box's local axes [m]
   * @param face Face acting as the floor
   * @param orientation Box orientation in world space
   * @param config Delay and mode
   * @throws std::invalid_argument if any half extent is not positive or the
   *         config fails validation
   */
  GravityBox(std::string name,
             int priority,
             const Coordinate& center,
             const Coordinate& halfExtents,
             FaceDirection face,
             const Eigen::Quaterniond& orientation,
             Config config);

  /// Box with the default delay in Orienting mode
  GravityBox(std::string name,
             int priority,
             const Coordinate& center,
             const Coordinate& halfExtents,
             FaceDirection face = FaceDirection::Down,
             const Eigen::Quaterniond& orientation =
               Eigen::Quaterniond::Identity());

  ~GravityBox() override = default;

  GravityBox(const GravityBox&) = delete;
  GravityBox& operator=(const GravityBox&) = delete;
  GravityBox(GravityBox&&) noexcept = default;
  GravityBox& operator=(GravityBox&&) noexcept = default;

  [[nodiscard]] Coordinate getGravityDirection(
    const GravityResolver& body) const override;

  [[nodiscard]] bool contains(const Coordinate& point) const override;

  void onBodyEntered(GravityResolver& body, double now) override;
  void onBodyExited(GravityResolver& body, double now) override;
  void update(double now) override;
  void forgetBody(GravityResolver& body) override;

  [[nodiscard]] bool isEntryPending(const GravityResolver& body) const;
  [[nodiscard]] bool isExitPending(const GravityResolver& body) const;

  [[nodiscard]] FaceDirection getFace() const
  {
    return face_;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  Coordinate center_;
  Coordinate halfExtents_;
  FaceDirection face_;
  Eigen::Quaterniond orientation_;
  Config config_;

  // Body -> time the boundary was crossed
  std::unordered_map<GravityResolver*, double> entering_;
  std::unordered_map<GravityResolver*, double> exiting_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_GRAVITY_BOX_HPP
