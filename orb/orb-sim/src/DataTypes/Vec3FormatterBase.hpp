// Ticket: 0001_gravity_datatypes

#ifndef ORB_SIM_VEC3_FORMATTER_BASE_HPP
#define ORB_SIM_VEC3_FORMATTER_BASE_HPP

#include <spdlog/fmt/fmt.h>

#include "orb-sim/src/DataTypes/Acceleration.hpp"
#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/DataTypes/Velocity.hpp"

namespace orb_sim::detail
{

/// Shared fmt formatter for 3-component vector types so they can be passed
/// straight to spdlog. Accepts any floating-point spec ("{:.3f}") and emits
/// "(x, y, z)" with the spec applied to each component.
template <typename T>
struct Vec3FormatterBase : fmt::formatter<double>
{
  template <typename FormatContext>
  auto format(const T& vec, FormatContext& ctx) const -> decltype(ctx.out())
  {
    auto out = fmt::format_to(ctx.out(), "(");
    for (Eigen::Index i = 0; i < 3; ++i)
    {
      if (i > 0)
      {
        out = fmt::format_to(out, ", ");
      }
      ctx.advance_to(out);
      out = fmt::formatter<double>::format(vec[i], ctx);
    }
    return fmt::format_to(out, ")");
  }
};

}  // namespace orb_sim::detail

template <>
struct fmt::formatter<orb_sim::Coordinate>
  : orb_sim::detail::Vec3FormatterBase<orb_sim::Coordinate>
{
};

template <>
struct fmt::formatter<orb_sim::Velocity>
  : orb_sim::detail::Vec3FormatterBase<orb_sim::Velocity>
{
};

template <>
struct fmt::formatter<orb_sim::Acceleration>
  : orb_sim::detail::Vec3FormatterBase<orb_sim::Acceleration>
{
};

#endif  // ORB_SIM_VEC3_FORMATTER_BASE_HPP
