// Ticket: 0005_gravity_areas

#ifndef ORB_SIM_PHYSICS_SPHERICAL_GRAVITY_AREA_HPP
#define ORB_SIM_PHYSICS_SPHERICAL_GRAVITY_AREA_HPP

#include <string>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/Gravity/GravityArea.hpp"

namespace orb_sim
{

/**
 * @brief Planet-style area pulling bodies towards its centre
 *
 * The direction depends on where the body is: it points from the body's
 * position to the centre. A body without a rigid body, or sitting exactly on
 * the centre, gets the resolver's world down instead.
 *
 * @ticket 0005_gravity_areas
 */
class SphericalGravityArea final : public GravityArea
{
public:
  /**
   * @param name Name used in log output
   * @param priority Priority among overlapping sources
   * @param center Centre of attraction
   * @param radius Radius of the trigger sphere [m]
   * @param mode Registration mode
   * @throws std::invalid_argument if radius <= 0
   */
  SphericalGravityArea(std::string name,
                       int priority,
                       const Coordinate& center,
                       double radius,
                       AreaMode mode = AreaMode::Orienting);

  [[nodiscard]] Coordinate getGravityDirection(
    const GravityResolver& body) const override;

  [[nodiscard]] bool contains(const Coordinate& point) const override;

  [[nodiscard]] const Coordinate& getCenter() const
  {
    return center_;
  }

  [[nodiscard]] double getRadius() const
  {
    return radius_;
  }

private:
  Coordinate center_;
  double radius_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_SPHERICAL_GRAVITY_AREA_HPP
