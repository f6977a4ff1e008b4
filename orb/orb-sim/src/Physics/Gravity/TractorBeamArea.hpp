// Ticket: 0011_tractor_beam

#ifndef ORB_SIM_PHYSICS_TRACTOR_BEAM_AREA_HPP
#define ORB_SIM_PHYSICS_TRACTOR_BEAM_AREA_HPP

#include <Eigen/Geometry>
#include <optional>
#include <string>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/Gravity/GravityArea.hpp"
#include "orb-sim/src/Physics/Gravity/GravityBox.hpp"

namespace orb_sim
{

/**
 * @brief Oriented box that pulls bodies towards one of its faces
 *
 * A body inside the beam stops feeling its own gravity: the beam registers
 * as a fixed-direction source, so the applied acceleration points at the
 * pull face with the beam's strength while the body's orientation is left
 * alone. Membership changes are immediate. Leaving the beam unregisters it
 * and the body's previous gravity applies again.
 *
 * A strength of zero suspends the body in place of pulling it.
 *
 * @ticket 0011_tractor_beam
 */
class TractorBeamArea final : public GravityArea
{
public:
  static constexpr double kMaxStrength{150.0};  // [m/s^2]

  /**
   * @brief Construct a tractor beam
   *
   * @param name Name used in log output
   * @param priority Priority among overlapping fixed-direction sources
   * @param center World-space centre
   * @param halfExtents Half size along the beam's local axes [m]
   * @param pullFace Face the beam pulls towards
   * @param strength Pull acceleration [m/s^2], within [0, kMaxStrength]
   * @param orientation Beam orientation in world space
   * @throws std::invalid_argument if any half extent is not positive or the
   *         strength is out of range
   */
  TractorBeamArea(std::string name,
                  int priority,
                  const Coordinate& center,
                  const Coordinate& halfExtents,
                  FaceDirection pullFace,
                  double strength,
                  const Eigen::Quaterniond& orientation =
                    Eigen::Quaterniond::Identity());

  ~TractorBeamArea() override = default;

  TractorBeamArea(const TractorBeamArea&) = delete;
  TractorBeamArea& operator=(const TractorBeamArea&) = delete;
  TractorBeamArea(TractorBeamArea&&) noexcept = default;
  TractorBeamArea& operator=(TractorBeamArea&&) noexcept = default;

  [[nodiscard]] Coordinate getGravityDirection(
    const GravityResolver& body) const override;

  [[nodiscard]] std::optional<double> getGravityStrength() const override
  {
    return strength_;
  }

  [[nodiscard]] bool contains(const Coordinate& point) const override;

  void onBodyEntered(GravityResolver& body, double now) override;
  void onBodyExited(GravityResolver& body, double now) override;

  [[nodiscard]] FaceDirection getPullFace() const
  {
    return pullFace_;
  }

private:
  Coordinate center_;
  Coordinate halfExtents_;
  FaceDirection pullFace_;
  double strength_;
  Eigen::Quaterniond orientation_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_TRACTOR_BEAM_AREA_HPP
