// Ticket: 0005_gravity_areas

#ifndef ORB_SIM_PHYSICS_DIRECTIONAL_GRAVITY_AREA_HPP
#define ORB_SIM_PHYSICS_DIRECTIONAL_GRAVITY_AREA_HPP

#include <string>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/Gravity/GravityArea.hpp"

namespace orb_sim
{

/**
 * @brief Axis-aligned box with a constant gravity direction
 *
 * Typically the direction is the opposite of the normal of the floor the
 * area belongs to. Membership changes take effect immediately.
 *
 * @ticket 0005_gravity_areas
 */
class DirectionalGravityArea final : public GravityArea
{
public:
  /**
   * @param name Name used in log output
   * @param priority Priority among overlapping sources
   * @param minCorner Lower corner of the trigger box
   * @param maxCorner Upper corner of the trigger box
   * @param direction Gravity direction (normalized on construction)
   * @param mode Registration mode
   * @throws std::invalid_argument if the box is empty along any axis or the
   *         direction is degenerate
   */
  DirectionalGravityArea(std::string name,
                         int priority,
                         const Coordinate& minCorner,
                         const Coordinate& maxCorner,
                         const Coordinate& direction,
                         AreaMode mode = AreaMode::Orienting);

  [[nodiscard]] Coordinate getGravityDirection(
    const GravityResolver& body) const override;

  [[nodiscard]] bool contains(const Coordinate& point) const override;

private:
  Coordinate minCorner_;
  Coordinate maxCorner_;
  Coordinate direction_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_DIRECTIONAL_GRAVITY_AREA_HPP
