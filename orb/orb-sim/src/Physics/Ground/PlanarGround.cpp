// Ticket: 0007_slope_grounding

#include "orb-sim/src/Physics/Ground/PlanarGround.hpp"

#include <stdexcept>
#include <string>

#include "orb-sim/src/Utils/VectorMath.hpp"

namespace orb_sim
{

namespace
{

bool withinDisc(const GroundPatch& patch, const Coordinate& pointOnPlane)
{
  return (pointOnPlane - patch.center).squaredNorm() <=
         patch.radius * patch.radius;
}

void keepNearest(std::optional<GroundHit>& best, const GroundHit& candidate)
{
  if (!best || candidate.distance < best->distance)
  {
    best = candidate;
  }
}

}  // namespace

size_t PlanarGround::addPatch(const GroundPatch& patch)
{
  const Coordinate normal = VectorMath::normalizedOrZero(patch.normal);
  if (normal.isExactlyZero())
  {
    throw std::invalid_argument("PlanarGround: patch normal must be non-zero");
  }
  if (patch.radius <= 0.0)
  {
    throw std::invalid_argument(
      "PlanarGround: patch radius must be positive, got: " +
      std::to_string(patch.radius));
  }
  patches_.push_back(GroundPatch{patch.center, normal, patch.radius});
  return patches_.size() - 1;
}

std::optional<GroundHit> PlanarGround::sphereCast(const Coordinate& origin,
                                                  double radius,
                                                  const Coordinate& direction,
                                                  double maxDistance) const
{
  const Coordinate dir = VectorMath::normalizedOrZero(direction);
  if (dir.isExactlyZero() || maxDistance < 0.0)
  {
    return std::nullopt;
  }

  std::optional<GroundHit> best;
  for (const auto& patch : patches_)
  {
    // Signed height of the sphere centre above the patch plane
    const double startHeight = patch.normal.dot(origin - patch.center);
    if (startHeight <= -radius)
    {
      continue;
    }

    if (startHeight < radius)
    {
      const Coordinate contact{origin - patch.normal * startHeight};
      if (withinDisc(patch, contact))
      {
        keepNearest(best, GroundHit{contact, patch.normal, 0.0});
      }
      continue;
    }

    const double approach = patch.normal.dot(dir);
    if (approach >= 0.0)
    {
      continue;
    }
    const double t = (startHeight - radius) / -approach;
    if (t > maxDistance)
    {
      continue;
    }
    const Coordinate contact{origin + dir * t - patch.normal * radius};
    if (withinDisc(patch, contact))
    {
      keepNearest(best, GroundHit{contact, patch.normal, t});
    }
  }
  return best;
}

std::optional<GroundHit> PlanarGround::rayCast(const Coordinate& origin,
                                               const Coordinate& direction,
                                               double maxDistance) const
{
  const Coordinate dir = VectorMath::normalizedOrZero(direction);
  if (dir.isExactlyZero() || maxDistance < 0.0)
  {
    return std::nullopt;
  }

  std::optional<GroundHit> best;
  for (const auto& patch : patches_)
  {
    const double startHeight = patch.normal.dot(origin - patch.center);
    const double approach = patch.normal.dot(dir);
    if (startHeight < 0.0 || approach >= 0.0)
    {
      continue;
    }
    const double t = startHeight / -approach;
    if (t > maxDistance)
    {
      continue;
    }
    const Coordinate contact{origin + dir * t};
    if (withinDisc(patch, contact))
    {
      keepNearest(best, GroundHit{contact, patch.normal, t});
    }
  }
  return best;
}

}  // namespace orb_sim
