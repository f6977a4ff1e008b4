// Ticket: 0004_gravity_resolver

#ifndef ORB_SIM_PHYSICS_GRAVITY_SOURCE_HPP
#define ORB_SIM_PHYSICS_GRAVITY_SOURCE_HPP

#include <optional>
#include <string>

#include "orb-sim/src/DataTypes/Coordinate.hpp"

namespace orb_sim
{

class GravityResolver;

/**
 * @brief Capability interface for anything that can pull a body "down"
 *
 * A source contributes a candidate gravity direction and an integer priority
 * while a body is inside its influence. The resolver depends only on this
 * interface; it never owns sources, so a source must outlive its membership
 * in every resolver it was added to.
 *
 * Thread safety: Read-only methods (thread-safe)
 *
 * @ticket 0004_gravity_resolver
 */
class GravitySource
{
public:
  virtual ~GravitySource() = default;

  /**
   * @brief Direction of gravity this source applies to the given body
   *
   * May depend on the body (e.g. radially inward towards a planet centre).
   * Need not be unit length; the resolver normalizes it and replaces a
   * degenerate result with its configured world down.
   *
   * @param body Resolver of the body being pulled
   * @return World-frame "down" direction
   */
  virtual Coordinate getGravityDirection(const GravityResolver& body) const = 0;

  /**
   * @brief Priority of this source; the highest active priority wins
   */
  virtual int getPriority() const = 0;

  /**
   * @brief Human readable name used in log output
   */
  virtual const std::string& getName() const = 0;

  /**
   * @brief Acceleration magnitude that replaces the body's own while this
   *        source drives the applied force
   *
   * Only consulted for fixed-direction sources. std::nullopt keeps the
   * resolver's configured magnitude.
   */
  virtual std::optional<double> getGravityStrength() const
  {
    return std::nullopt;
  }

protected:
  GravitySource() = default;
  GravitySource(const GravitySource&) = default;
  GravitySource& operator=(const GravitySource&) = default;
  GravitySource(GravitySource&&) noexcept = default;
  GravitySource& operator=(GravitySource&&) noexcept = default;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_GRAVITY_SOURCE_HPP
