// Ticket: 0007_slope_grounding

#ifndef ORB_SIM_PHYSICS_GROUND_PROBE_HPP
#define ORB_SIM_PHYSICS_GROUND_PROBE_HPP

#include <optional>

#include "orb-sim/src/DataTypes/Coordinate.hpp"

namespace orb_sim
{

/**
 * @brief Result of a ground probe
 */
struct GroundHit
{
  Coordinate point;   // Contact point in world space
  Coordinate normal;  // Unit surface normal at the contact
  double distance;    // Travel along the cast direction [m]
};

/**
 * @brief Scene query used to find the surface under a body
 *
 * Both casts take a direction that need not be unit length; a degenerate
 * direction never hits. Only the nearest hit within maxDistance is reported.
 *
 * Thread safety: Read-only methods (thread-safe)
 *
 * @ticket 0007_slope_grounding
 */
class GroundProbe
{
public:
  virtual ~GroundProbe() = default;

  /**
   * @brief Sweep a sphere and report the first surface it touches
   * @param origin Start centre of the sphere
   * @param radius Sphere radius [m]
   * @param direction Sweep direction
   * @param maxDistance Maximum sweep length [m]
   * @return Nearest hit, or nothing
   */
  virtual std::optional<GroundHit> sphereCast(const Coordinate& origin,
                                              double radius,
                                              const Coordinate& direction,
                                              double maxDistance) const = 0;

  /**
   * @brief Cast a ray and report the first surface it crosses
   */
  virtual std::optional<GroundHit> rayCast(const Coordinate& origin,
                                           const Coordinate& direction,
                                           double maxDistance) const = 0;

protected:
  GroundProbe() = default;
  GroundProbe(const GroundProbe&) = default;
  GroundProbe& operator=(const GroundProbe&) = default;
  GroundProbe(GroundProbe&&) noexcept = default;
  GroundProbe& operator=(GroundProbe&&) noexcept = default;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_GROUND_PROBE_HPP
