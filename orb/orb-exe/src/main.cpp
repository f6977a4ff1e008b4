// Ticket: 0010_demo_level

#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <numbers>

#include "orb-sim/src/DataTypes/Vec3FormatterBase.hpp"
#include "orb-sim/src/Environment/WorldModel.hpp"
#include "orb-sim/src/Physics/Gravity/DirectionalGravityArea.hpp"
#include "orb-sim/src/Physics/Gravity/GravityBox.hpp"
#include "orb-sim/src/Physics/Gravity/SphericalGravityArea.hpp"
#include "orb-sim/src/Physics/Gravity/TractorBeamArea.hpp"

using namespace orb_sim;

namespace
{

constexpr std::chrono::milliseconds kStep{20};
constexpr std::chrono::milliseconds kDuration{8000};

// A flat yard, a 30 degree ramp climbing +Z, a wall box whose floor is the
// +X face, a tractor beam lifting off the far corner, and a small planet far
// above the yard
void buildLevel(WorldModel& world)
{
  world.emplaceArea<DirectionalGravityArea>("yard",
                                            0,
                                            Coordinate{-50.0, -5.0, -50.0},
                                            Coordinate{50.0, 20.0, 50.0},
                                            Coordinate{0.0, -1.0, 0.0});

  world.emplaceArea<GravityBox>("wall",
                                5,
                                Coordinate{8.0, 5.0, 12.0},
                                Coordinate{2.0, 5.0, 2.0},
                                FaceDirection::Right);

  world.emplaceArea<TractorBeamArea>("lift",
                                     0,
                                     Coordinate{-20.0, 5.0, -20.0},
                                     Coordinate{2.0, 5.0, 2.0},
                                     FaceDirection::Up,
                                     15.0);

  world.emplaceArea<SphericalGravityArea>(
    "planet", 10, Coordinate{0.0, 60.0, 0.0}, 20.0);

  world.addGroundPatch(
    GroundPatch{Coordinate{0.0, 0.0, 0.0}, Coordinate{0.0, 1.0, 0.0}, 40.0});

  const double slope = 30.0 * std::numbers::pi / 180.0;
  // Lower rim of the ramp rests on the yard at z = 6
  world.addGroundPatch(GroundPatch{Coordinate{0.0, 1.5, 8.6},
                                   Coordinate{0.0, std::cos(slope),
                                              -std::sin(slope)},
                                   3.0});
}

}  // namespace

int main()
{
  spdlog::set_level(spdlog::level::info);

  WorldModel world;
  buildLevel(world);

  Actor& actor = world.spawnActor(Coordinate{0.0, 0.0, 0.0});
  GravityResolver& resolver = actor.getResolver();

  resolver.addGravityChangedListener(
    [&resolver](const Coordinate& from, const Coordinate& to, double duration)
    {
      spdlog::info("t={:.2f}s gravity {:.3f} -> {:.3f} over {:.2f}s",
                   resolver.getSimTime(),
                   from,
                   to,
                   duration);
    });
  resolver.addSpaceTransitionListener(
    [&resolver](bool entering, const Coordinate& direction)
    {
      spdlog::info("t={:.2f}s {} space, down {:.3f}",
                   resolver.getSimTime(),
                   entering ? "entered" : "left",
                   direction);
    });

  bool wasGrounded = false;
  for (auto t = kStep; t <= kDuration; t += kStep)
  {
    // Walk towards the ramp, then jump towards the wall box
    RigidBody& body = actor.getBody();
    if (t == std::chrono::milliseconds{3000})
    {
      body.applyVelocityChange(Velocity{6.0, 6.0, 0.0});
    }
    else if (actor.getGrounder().isGrounded())
    {
      const Coordinate forward = body.getForward();
      body.applyAcceleration(Acceleration{forward * 2.0});
    }

    world.update(t);

    const bool grounded = actor.getGrounder().isGrounded();
    if (grounded != wasGrounded)
    {
      spdlog::info("t={:.2f}s {} (ground angle {:.1f} deg)",
                   resolver.getSimTime(),
                   grounded ? "landed" : "airborne",
                   actor.getGrounder().getGroundAngleDeg());
      wasGrounded = grounded;
    }
  }

  spdlog::info("final position {:.2f}, velocity {:.2f}, down {:.3f}",
               actor.getBody().getPosition(),
               actor.getBody().getVelocity(),
               resolver.getEffectiveDirection());
  return 0;
}
