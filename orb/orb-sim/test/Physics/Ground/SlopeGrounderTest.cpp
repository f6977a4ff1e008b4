// Ticket: 0007_slope_grounding

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <stdexcept>

#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"
#include "orb-sim/src/Physics/Ground/PlanarGround.hpp"
#include "orb-sim/src/Physics/Ground/SlopeGrounder.hpp"
#include "orb-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "orb-sim/test/Helpers/GravityTestHelpers.hpp"

using namespace orb_sim;
using orb_sim::test::expectVectorNear;
using orb_sim::test::ScriptedGroundProbe;
using orb_sim::test::StubGravitySource;

namespace
{

constexpr double kDt = 0.02;

double toRadians(double degrees)
{
  return degrees * std::numbers::pi / 180.0;
}

// Slope rising towards +Z, passing through the origin
Coordinate slopeNormal(double degrees)
{
  const double a = toRadians(degrees);
  return Coordinate{0.0, std::cos(a), -std::sin(a)};
}

Coordinate slopeUphill(double degrees)
{
  const double a = toRadians(degrees);
  return Coordinate{0.0, std::sin(a), std::cos(a)};
}

// Body standing at the origin under downward gravity on one patch
struct SlopeFixture
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  StubGravitySource floor{"floor", 0, Coordinate{0.0, -1.0, 0.0}};
  PlanarGround ground;

  explicit SlopeFixture(double degrees)
  {
    resolver.addZone(&floor);
    ground.addPatch(
      GroundPatch{Coordinate{0.0, 0.0, 0.0}, slopeNormal(degrees), 10.0});
  }
};

}  // namespace

// ============================================================================
// Probing
// ============================================================================

TEST(SlopeGrounderTest, FlatFloor_GroundedAndStuck)
{
  SlopeFixture f{0.0};
  SlopeGrounder grounder{&f.body, &f.resolver, &f.ground};
  f.body.setVelocity(Velocity{3.0, 0.0, 0.0});

  grounder.update(kDt);

  EXPECT_TRUE(grounder.isGrounded());
  EXPECT_NEAR(grounder.getGroundAngleDeg(), 0.0, 1e-9);
  expectVectorNear(grounder.getGroundNormal(), Coordinate{0.0, 1.0, 0.0});
  // Stick acceleration 25 over 0.02 s
  expectVectorNear(f.body.getVelocity(), Coordinate{3.0, -0.5, 0.0});
}

TEST(SlopeGrounderTest, HighAboveGround_Airborne)
{
  SlopeFixture f{0.0};
  SlopeGrounder grounder{&f.body, &f.resolver, &f.ground};
  f.body.setPosition(Coordinate{0.0, 5.0, 0.0});
  f.body.setVelocity(Velocity{1.0, 2.0, 0.0});

  grounder.update(kDt);

  EXPECT_FALSE(grounder.isGrounded());
  EXPECT_DOUBLE_EQ(grounder.getGroundAngleDeg(), 180.0);
  expectVectorNear(grounder.getGroundNormal(), Coordinate{0.0, 1.0, 0.0});
  expectVectorNear(f.body.getVelocity(), Coordinate{1.0, 2.0, 0.0});
}

TEST(SlopeGrounderTest, SphereMiss_FallsBackToRay)
{
  SlopeFixture f{0.0};
  ScriptedGroundProbe probe;
  probe.rayHit =
    GroundHit{Coordinate{0.0, 0.0, 0.0}, Coordinate{0.0, 2.0, 0.0}, 0.05};
  SlopeGrounder grounder{&f.body, &f.resolver, &probe};

  grounder.update(kDt);

  EXPECT_TRUE(grounder.isGrounded());
  expectVectorNear(grounder.getGroundNormal(), Coordinate{0.0, 1.0, 0.0});
}

TEST(SlopeGrounderTest, BackfaceOrDegenerateNormal_Airborne)
{
  SlopeFixture f{0.0};
  ScriptedGroundProbe probe;
  SlopeGrounder grounder{&f.body, &f.resolver, &probe};

  probe.sphereHit =
    GroundHit{Coordinate{0.0, 0.0, 0.0}, Coordinate{0.0, -1.0, 0.0}, 0.0};
  grounder.update(kDt);
  EXPECT_FALSE(grounder.isGrounded());

  probe.sphereHit =
    GroundHit{Coordinate{0.0, 0.0, 0.0}, Coordinate{0.0, 0.0, 0.0}, 0.0};
  grounder.update(kDt);
  EXPECT_FALSE(grounder.isGrounded());
}

TEST(SlopeGrounderTest, NoProbe_Airborne)
{
  SlopeFixture f{0.0};
  SlopeGrounder grounder{&f.body, &f.resolver, nullptr};

  grounder.update(kDt);

  EXPECT_FALSE(grounder.isGrounded());

  grounder.setProbe(&f.ground);
  grounder.update(kDt);
  EXPECT_TRUE(grounder.isGrounded());
}

// ============================================================================
// Walkable Slopes
// ============================================================================

TEST(SlopeGrounderTest, WalkableSlope_ReportsAngle)
{
  SlopeFixture f{30.0};
  SlopeGrounder grounder{&f.body, &f.resolver, &f.ground};

  grounder.update(kDt);

  ASSERT_TRUE(grounder.isGrounded());
  EXPECT_NEAR(grounder.getGroundAngleDeg(), 30.0, 1e-9);
  expectVectorNear(grounder.getGroundNormal(), slopeNormal(30.0));
}

TEST(SlopeGrounderTest, WalkableSlope_BrakesDownhillDriftWithoutReversing)
{
  SlopeFixture f{30.0};
  SlopeGrounder grounder{&f.body, &f.resolver, &f.ground};
  const Coordinate downhill{-slopeUphill(30.0)};
  f.body.setVelocity(Velocity{downhill * 1.0});

  grounder.update(kDt);

  // 1.0 + stick share (0.5 * sin 30) - brake (20 * 0.02)
  EXPECT_NEAR(Coordinate{f.body.getVelocity()}.dot(downhill), 0.85, 1e-9);
}

TEST(SlopeGrounderTest, WalkableSlope_SlowDriftStopsCompletely)
{
  SlopeFixture f{30.0};
  SlopeGrounder grounder{&f.body, &f.resolver, &f.ground};
  const Coordinate downhill{-slopeUphill(30.0)};
  f.body.setVelocity(Velocity{downhill * 0.1});

  grounder.update(kDt);

  EXPECT_NEAR(Coordinate{f.body.getVelocity()}.dot(downhill), 0.0, 1e-9);
}

TEST(SlopeGrounderTest, WalkableSlope_UpwardVelocityRemoved)
{
  SlopeFixture f{0.0};
  SlopeGrounder grounder{&f.body, &f.resolver, &f.ground};
  f.body.setVelocity(Velocity{2.0, 4.0, 0.0});

  grounder.update(kDt);

  expectVectorNear(f.body.getVelocity(), Coordinate{2.0, -0.5, 0.0});
}

// ============================================================================
// Steep Slopes
// ============================================================================

TEST(SlopeGrounderTest, SteepSlope_UphillMotionRemoved)
{
  SlopeFixture f{60.0};
  SlopeGrounder::Config config;
  config.killUpwardWhenGrounded = false;
  config.stickAccel = 0.0;
  SlopeGrounder grounder{&f.body, &f.resolver, &f.ground, config};
  f.body.setVelocity(
    Velocity{slopeUphill(60.0) * 2.0 + Coordinate{1.0, 0.0, 0.0}});

  grounder.update(kDt);

  ASSERT_TRUE(grounder.isGrounded());
  EXPECT_NEAR(grounder.getGroundAngleDeg(), 60.0, 1e-9);
  expectVectorNear(f.body.getVelocity(), Coordinate{1.0, 0.0, 0.0});
}

TEST(SlopeGrounderTest, SteepSlope_DefaultsNeverClimb)
{
  SlopeFixture f{60.0};
  SlopeGrounder grounder{&f.body, &f.resolver, &f.ground};
  f.body.setVelocity(
    Velocity{slopeUphill(60.0) * 2.0 + Coordinate{1.0, 0.0, 0.0}});

  grounder.update(kDt);

  const Coordinate v{f.body.getVelocity()};
  EXPECT_LE(v.dot(slopeUphill(60.0)), 0.0);
  EXPECT_NEAR(v.x(), 1.0, 1e-9);
}

TEST(SlopeGrounderTest, SteepSlope_ClimbAllowedWhenNotBlocked)
{
  SlopeFixture f{60.0};
  SlopeGrounder::Config config;
  config.killUpwardWhenGrounded = false;
  config.blockClimbOnSteep = false;
  config.stickAccel = 0.0;
  SlopeGrounder grounder{&f.body, &f.resolver, &f.ground, config};
  f.body.setVelocity(Velocity{slopeUphill(60.0) * 2.0});

  grounder.update(kDt);

  EXPECT_NEAR(Coordinate{f.body.getVelocity()}.dot(slopeUphill(60.0)),
              2.0,
              1e-9);
}

// ============================================================================
// Arbitrary Gravity
// ============================================================================

TEST(SlopeGrounderTest, WallGravity_WallIsFloor)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  StubGravitySource wallPull{"wall", 0, Coordinate{1.0, 0.0, 0.0}};
  resolver.addZone(&wallPull);
  PlanarGround ground;
  ground.addPatch(
    GroundPatch{Coordinate{0.0, 0.0, 0.0}, Coordinate{-1.0, 0.0, 0.0}, 5.0});
  SlopeGrounder grounder{&body, &resolver, &ground};

  grounder.update(kDt);

  EXPECT_TRUE(grounder.isGrounded());
  EXPECT_NEAR(grounder.getGroundAngleDeg(), 0.0, 1e-9);
  // Pushed into the wall along gravity
  expectVectorNear(body.getVelocity(), Coordinate{0.5, 0.0, 0.0});
}

// ============================================================================
// Validation
// ============================================================================

TEST(SlopeGrounderTest, InvalidConfig_Throws)
{
  SlopeGrounder::Config tinyProbe;
  tinyProbe.probeRadius = 0.001;
  EXPECT_THROW(SlopeGrounder(nullptr, nullptr, nullptr, tinyProbe),
               std::invalid_argument);

  SlopeGrounder::Config shortProbe;
  shortProbe.probeDistance = 0.01;
  EXPECT_THROW(SlopeGrounder(nullptr, nullptr, nullptr, shortProbe),
               std::invalid_argument);

  SlopeGrounder::Config vertical;
  vertical.maxSlopeAngleDeg = 90.0;
  EXPECT_THROW(SlopeGrounder(nullptr, nullptr, nullptr, vertical),
               std::invalid_argument);
}

TEST(SlopeGrounderTest, MissingCollaborators_StayAirborne)
{
  SlopeGrounder grounder{nullptr, nullptr, nullptr};

  grounder.update(kDt);

  EXPECT_FALSE(grounder.isGrounded());
}
