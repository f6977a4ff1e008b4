// Ticket: 0002_orientation_math

#include "orb-sim/src/Utils/VectorMath.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace orb_sim::VectorMath
{

Coordinate projectOnPlane(const Coordinate& vec, const Coordinate& planeNormal)
{
  const double normalSq = planeNormal.squaredNorm();
  if (normalSq < kMinDirectionNorm * kMinDirectionNorm)
  {
    return vec;
  }
  return vec - planeNormal * (vec.dot(planeNormal) / normalSq);
}

Coordinate normalizedOrZero(const Coordinate& vec)
{
  const double norm = vec.norm();
  if (norm < kMinDirectionNorm)
  {
    return Coordinate{0.0, 0.0, 0.0};
  }
  return vec / norm;
}

Coordinate safeNormalized(const Coordinate& vec, const Coordinate& fallback)
{
  const double norm = vec.norm();
  if (norm < kMinDirectionNorm || !std::isfinite(norm))
  {
    return fallback;
  }
  return vec / norm;
}

double angleBetweenDeg(const Coordinate& a, const Coordinate& b)
{
  const double denom = a.norm() * b.norm();
  if (denom < kMinDirectionNorm * kMinDirectionNorm)
  {
    return 0.0;
  }
  const double cosAngle = std::clamp(a.dot(b) / denom, -1.0, 1.0);
  return std::acos(cosAngle) * 180.0 / std::numbers::pi;
}

Eigen::Quaterniond fromToRotation(const Coordinate& from, const Coordinate& to)
{
  if (from.norm() < kMinDirectionNorm || to.norm() < kMinDirectionNorm)
  {
    return Eigen::Quaterniond::Identity();
  }
  // FromTwoVectors picks a perpendicular axis for the antiparallel case
  return Eigen::Quaterniond::FromTwoVectors(from, to).normalized();
}

Eigen::Quaterniond lookRotation(const Coordinate& forward, const Coordinate& up)
{
  const Coordinate z = normalizedOrZero(forward);
  if (z.isExactlyZero())
  {
    return Eigen::Quaterniond::Identity();
  }

  const Coordinate x = normalizedOrZero(up.cross(z));
  if (x.isExactlyZero())
  {
    // up is parallel to forward: no unique roll, take the shortest arc
    return fromToRotation(Coordinate{0.0, 0.0, 1.0}, z);
  }
  const Coordinate y = z.cross(x);

  Eigen::Matrix3d basis;
  basis.col(0) = x;
  basis.col(1) = y;
  basis.col(2) = z;
  return Eigen::Quaterniond{basis}.normalized();
}

Eigen::Quaterniond slerpClamped(const Eigen::Quaterniond& from,
                                const Eigen::Quaterniond& to,
                                double t)
{
  return from.slerp(std::clamp(t, 0.0, 1.0), to).normalized();
}

}  // namespace orb_sim::VectorMath
