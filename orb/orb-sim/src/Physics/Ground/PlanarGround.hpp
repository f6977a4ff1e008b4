// Ticket: 0007_slope_grounding

#ifndef ORB_SIM_PHYSICS_PLANAR_GROUND_HPP
#define ORB_SIM_PHYSICS_PLANAR_GROUND_HPP

#include <optional>
#include <vector>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/Ground/GroundProbe.hpp"

namespace orb_sim
{

/**
 * @brief Flat circular piece of walkable geometry
 *
 * One-sided: only the side the normal points to is solid.
 */
struct GroundPatch
{
  Coordinate center;
  Coordinate normal;
  double radius;
};

/**
 * @brief Ground probe over a set of disc-shaped patches
 *
 * Sphere casts test face contacts only; a sphere grazing a disc rim is not
 * reported. A sphere already overlapping a patch face at the start of the
 * sweep hits at distance zero.
 *
 * @ticket 0007_slope_grounding
 */
class PlanarGround final : public GroundProbe
{
public:
  PlanarGround() = default;

  /**
   * @brief Add a patch
   * @return Index of the patch
   * @throws std::invalid_argument if the normal is degenerate or the radius
   *         is not positive
   */
  size_t addPatch(const GroundPatch& patch);

  [[nodiscard]] const std::vector<GroundPatch>& getPatches() const
  {
    return patches_;
  }

  std::optional<GroundHit> sphereCast(const Coordinate& origin,
                                      double radius,
                                      const Coordinate& direction,
                                      double maxDistance) const override;

  std::optional<GroundHit> rayCast(const Coordinate& origin,
                                   const Coordinate& direction,
                                   double maxDistance) const override;

private:
  std::vector<GroundPatch> patches_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_PLANAR_GROUND_HPP
