// Ticket: 0005_gravity_areas

#ifndef ORB_SIM_PHYSICS_GRAVITY_AREA_HPP
#define ORB_SIM_PHYSICS_GRAVITY_AREA_HPP

#include <cstdint>
#include <string>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/Gravity/GravitySource.hpp"

namespace orb_sim
{

/**
 * @brief How an area registers itself with the bodies inside it
 */
enum class AreaMode : uint8_t
{
  Orienting,       // Pulls and rotates the body (GravityResolver::addZone)
  FixedDirection   // Pulls without rotating (addFixedDirectionSource)
};

/**
 * @brief Gravity source with a trigger volume
 *
 * The world tests containment every step and reports edges through
 * onBodyEntered() / onBodyExited(). The default reaction is immediate
 * registration with the body's resolver; subclasses may postpone it and
 * finish the work in update().
 *
 * @ticket 0005_gravity_areas
 */
class GravityArea : public GravitySource
{
public:
  ~GravityArea() override = default;

  [[nodiscard]] int getPriority() const override
  {
    return priority_;
  }

  [[nodiscard]] const std::string& getName() const override
  {
    return name_;
  }

  [[nodiscard]] AreaMode getMode() const
  {
    return mode_;
  }

  /**
   * @brief Whether a world point lies inside the trigger volume
   */
  [[nodiscard]] virtual bool contains(const Coordinate& point) const = 0;

  /**
   * @brief A body's position moved into the volume
   * @param body Resolver of the entering body
   * @param now Simulation time [s]
   */
  virtual void onBodyEntered(GravityResolver& body, double now);

  /**
   * @brief A body's position moved out of the volume
   * @param body Resolver of the leaving body
   * @param now Simulation time [s]
   */
  virtual void onBodyExited(GravityResolver& body, double now);

  /**
   * @brief Apply any postponed work that is due
   * @param now Simulation time [s]
   */
  virtual void update(double now);

  /**
   * @brief Drop every reference to a body that is about to be destroyed
   */
  virtual void forgetBody(GravityResolver& body);

protected:
  GravityArea(std::string name, int priority, AreaMode mode);

  GravityArea(const GravityArea&) = default;
  GravityArea& operator=(const GravityArea&) = default;
  GravityArea(GravityArea&&) noexcept = default;
  GravityArea& operator=(GravityArea&&) noexcept = default;

  /// Register with the resolver according to the area mode
  void attach(GravityResolver& body) const;

  /// Unregister from the resolver according to the area mode
  void detach(GravityResolver& body) const;

private:
  std::string name_;
  int priority_;
  AreaMode mode_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_GRAVITY_AREA_HPP
