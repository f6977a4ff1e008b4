// Ticket: 0002_orientation_math

#ifndef ORB_SIM_VECTOR_MATH_HPP
#define ORB_SIM_VECTOR_MATH_HPP

#include <Eigen/Geometry>

#include "orb-sim/src/DataTypes/Coordinate.hpp"

namespace orb_sim
{

/**
 * @brief Direction and orientation helpers shared by the gravity components
 *
 * Conventions: a body's local up is +Y and its local forward is +Z. All
 * functions are pure; degenerate input never produces NaN, it produces the
 * documented fallback instead.
 *
 * @ticket 0002_orientation_math
 */
namespace VectorMath
{

/// Vectors shorter than this are treated as having no direction
constexpr double kMinDirectionNorm = 1e-5;

/**
 * @brief Remove the component of a vector along a plane normal
 * @param vec Vector to project
 * @param planeNormal Plane normal (need not be unit length)
 * @return vec projected onto the plane; vec unchanged if the normal is
 *         degenerate
 */
Coordinate projectOnPlane(const Coordinate& vec, const Coordinate& planeNormal);

/**
 * @brief Unit vector in the direction of vec, or exactly zero
 *
 * Mirrors the usual game-engine "normalized" semantics: vectors shorter than
 * kMinDirectionNorm normalize to the zero vector.
 */
Coordinate normalizedOrZero(const Coordinate& vec);

/**
 * @brief Unit vector in the direction of vec, or the fallback if degenerate
 * @param vec Vector to normalize
 * @param fallback Returned unchanged when vec has no usable direction
 */
Coordinate safeNormalized(const Coordinate& vec, const Coordinate& fallback);

/**
 * @brief Unsigned angle between two vectors [deg]
 * @return Angle in [0, 180]; 0 if either vector is degenerate
 */
double angleBetweenDeg(const Coordinate& a, const Coordinate& b);

/**
 * @brief Shortest-arc rotation taking one direction onto another
 *
 * Antiparallel input rotates by 180 degrees about an arbitrary perpendicular
 * axis. Degenerate input yields the identity.
 */
Eigen::Quaterniond fromToRotation(const Coordinate& from, const Coordinate& to);

/**
 * @brief Orientation whose +Z axis faces forward and whose +Y axis is as
 *        close to up as possible
 *
 * @param forward Desired forward direction (need not be unit length)
 * @param up Desired up direction (need not be unit length)
 * @return Orientation quaternion; identity if forward is degenerate, shortest
 *         arc from +Z onto forward if up is parallel to forward
 */
Eigen::Quaterniond lookRotation(const Coordinate& forward,
                                const Coordinate& up);

/**
 * @brief Spherical interpolation with the parameter clamped to [0, 1]
 */
Eigen::Quaterniond slerpClamped(const Eigen::Quaterniond& from,
                                const Eigen::Quaterniond& to,
                                double t);

}  // namespace VectorMath

}  // namespace orb_sim

#endif  // ORB_SIM_VECTOR_MATH_HPP
