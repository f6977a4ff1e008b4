// Ticket: 0004_gravity_resolver

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <stdexcept>

#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"
#include "orb-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "orb-sim/src/Utils/VectorMath.hpp"
#include "orb-sim/test/Helpers/GravityTestHelpers.hpp"

using namespace orb_sim;
using orb_sim::test::expectUnitOrZero;
using orb_sim::test::expectVectorNear;
using orb_sim::test::GravityEventLog;
using orb_sim::test::StubGravitySource;

namespace
{

const Coordinate kDown{0.0, -1.0, 0.0};
const Coordinate kSide{1.0, 0.0, 0.0};
const Coordinate kForward{0.0, 0.0, -1.0};

double degToRad(double deg)
{
  return deg * std::numbers::pi / 180.0;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(GravityResolverTest, Constructor_Default_StartsInSpaceWithWorldDown)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};

  EXPECT_TRUE(resolver.isInSpace());
  EXPECT_TRUE(resolver.getGravityDirection().isExactlyZero());
  expectVectorNear(resolver.getLastValidDirection(), kDown);
  expectVectorNear(resolver.getEffectiveDirection(), kDown);
  expectVectorNear(resolver.getGravityUp(), Coordinate{0.0, 1.0, 0.0});
  EXPECT_EQ(resolver.getOrientationState(), OrientationState::Stable);
  EXPECT_DOUBLE_EQ(resolver.getTransitionProgress(), 1.0);
  EXPECT_EQ(resolver.getZoneCount(), 0u);
}

TEST(GravityResolverTest, Constructor_InvalidConfig_Throws)
{
  RigidBody body{1.0};

  GravityResolver::Config negativeMagnitude;
  negativeMagnitude.gravityMagnitude = -1.0;
  EXPECT_THROW(GravityResolver(&body, negativeMagnitude),
               std::invalid_argument);

  GravityResolver::Config zeroSpeed;
  zeroSpeed.gravityTransitionSpeed = 0.0;
  EXPECT_THROW(GravityResolver(&body, zeroSpeed), std::invalid_argument);

  GravityResolver::Config noDown;
  noDown.worldDown = Coordinate{0.0, 0.0, 0.0};
  EXPECT_THROW(GravityResolver(&body, noDown), std::invalid_argument);

  GravityResolver::Config badThreshold;
  badThreshold.directionChangeDot = 1.5;
  EXPECT_THROW(GravityResolver(&body, badThreshold), std::invalid_argument);
}

TEST(GravityResolverTest, Constructor_CustomWorldDown_IsNormalized)
{
  GravityResolver::Config config;
  config.worldDown = Coordinate{0.0, 0.0, -3.0};
  GravityResolver resolver{nullptr, config};

  expectVectorNear(resolver.getEffectiveDirection(), Coordinate{0.0, 0.0, -1.0});
}

// ============================================================================
// Zone membership
// ============================================================================

TEST(GravityResolverTest, AddZone_MatchingCurrentUp_LeavesSpaceWithoutTransition)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource floor{"floor", 0, kDown};

  resolver.addZone(&floor);

  EXPECT_FALSE(resolver.isInSpace());
  expectVectorNear(resolver.getGravityDirection(), kDown);
  EXPECT_TRUE(log.started.empty());
  ASSERT_EQ(log.space.size(), 1u);
  EXPECT_FALSE(log.space[0].first);
  expectVectorNear(log.space[0].second, kDown);
  EXPECT_FALSE(resolver.isTransitioning());
}

TEST(GravityResolverTest, AddZone_Twice_IsIdempotent)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource floor{"floor", 0, kDown};
  StubGravitySource wall{"wall", 1, kSide};

  resolver.addZone(&floor);
  resolver.addZone(&wall);
  const auto orientation = body.getOrientation();
  const auto eventCount = log.started.size();

  resolver.addZone(&wall);

  EXPECT_EQ(resolver.getZoneCount(), 2u);
  EXPECT_EQ(log.started.size(), eventCount);
  EXPECT_TRUE(body.getOrientation().isApprox(orientation, 1e-12));
  expectVectorNear(resolver.getGravityDirection(), kSide);
}

TEST(GravityResolverTest, RemoveZone_NotPresent_IsNoOp)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource floor{"floor", 0, kDown};
  StubGravitySource stranger{"stranger", 3, kSide};
  resolver.addZone(&floor);

  resolver.removeZone(&stranger);

  EXPECT_EQ(resolver.getZoneCount(), 1u);
  EXPECT_FALSE(resolver.isInSpace());
  EXPECT_EQ(log.space.size(), 1u);
}

TEST(GravityResolverTest, AddZone_Null_IsIgnored)
{
  GravityResolver resolver{nullptr};

  resolver.addZone(nullptr);
  resolver.removeZone(nullptr);

  EXPECT_EQ(resolver.getZoneCount(), 0u);
  EXPECT_TRUE(resolver.isInSpace());
}

// ============================================================================
// Priority resolution
// ============================================================================

TEST(GravityResolverTest, Priority_EqualHighest_MostRecentWins)
{
  GravityResolver resolver{nullptr};
  StubGravitySource a{"A", 1, kDown};
  StubGravitySource b{"B", 3, kSide};
  StubGravitySource c{"C", 3, kForward};

  resolver.addZone(&a);
  resolver.addZone(&b);
  resolver.addZone(&c);
  expectVectorNear(resolver.getGravityDirection(), kForward);

  resolver.removeZone(&c);
  expectVectorNear(resolver.getGravityDirection(), kSide);

  resolver.removeZone(&b);
  expectVectorNear(resolver.getGravityDirection(), kDown);
}

TEST(GravityResolverTest, Priority_LowerAddedLater_DoesNotOverride)
{
  GravityResolver resolver{nullptr};
  StubGravitySource high{"high", 5, kSide};
  StubGravitySource low{"low", 0, kDown};

  resolver.addZone(&high);
  resolver.addZone(&low);

  expectVectorNear(resolver.getGravityDirection(), kSide);
}

TEST(GravityResolverTest, RemoveZone_NonDominant_NeverRotatesBody)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource floor{"floor", 0, kDown};
  StubGravitySource wall{"wall", 5, kSide};
  resolver.addZone(&floor);
  resolver.addZone(&wall);
  const auto orientation = body.getOrientation();
  const auto eventCount = log.started.size();

  resolver.removeZone(&floor);

  EXPECT_TRUE(body.getOrientation().isApprox(orientation, 1e-12));
  EXPECT_EQ(log.started.size(), eventCount);
  expectVectorNear(resolver.getGravityDirection(), kSide);
}

TEST(GravityResolverTest, RemoveZone_DominantSide_NotifiesOnce)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource floor{"floor", 0, kDown};
  StubGravitySource wall{"wall", 5, kSide};
  resolver.addZone(&floor);
  resolver.addZone(&wall);
  log.started.clear();
  log.completed.clear();

  resolver.removeZone(&wall);

  ASSERT_EQ(log.started.size(), 1u);
  expectVectorNear(log.started[0].from, kSide);
  expectVectorNear(log.started[0].to, kDown);
  EXPECT_EQ(log.completed.size(), 1u);
  expectVectorNear(body.getUp(), Coordinate{0.0, 1.0, 0.0});
}

TEST(GravityResolverTest, RemoveZone_DominantSameDirection_NoEvent)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource floor{"floor", 0, kDown};
  // Within the 0.999 dot threshold of the floor
  StubGravitySource ramp{"ramp", 5, Coordinate{0.02, -1.0, 0.0}};
  resolver.addZone(&floor);
  resolver.addZone(&ramp);
  const auto orientation = body.getOrientation();

  resolver.removeZone(&ramp);

  EXPECT_TRUE(log.started.empty());
  EXPECT_TRUE(log.completed.empty());
  expectVectorNear(resolver.getGravityDirection(), kDown);
  EXPECT_TRUE(body.getOrientation().isApprox(orientation, 1e-12));
}

// ============================================================================
// Direction invariants
// ============================================================================

TEST(GravityResolverTest, Direction_UnnormalizedSource_IsUnitLength)
{
  GravityResolver resolver{nullptr};
  StubGravitySource zone{"zone", 0, Coordinate{3.0, -4.0, 0.0}};

  resolver.addZone(&zone);

  expectUnitOrZero(resolver.getGravityDirection());
  expectVectorNear(resolver.getGravityDirection(), Coordinate{0.6, -0.8, 0.0});
}

TEST(GravityResolverTest, Direction_DegenerateSource_FallsBackToWorldDown)
{
  GravityResolver resolver{nullptr};
  StubGravitySource zone{"zone", 0, Coordinate{0.0, 0.0, 0.0}};

  resolver.addZone(&zone);

  expectVectorNear(resolver.getGravityDirection(), kDown);
  EXPECT_FALSE(resolver.isInSpace());
}

TEST(GravityResolverTest, Direction_ThroughMembershipChanges_AlwaysUnitOrZero)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  StubGravitySource a{"A", 0, Coordinate{0.0, -2.0, 0.0}};
  StubGravitySource b{"B", 2, Coordinate{5.0, 5.0, 0.0}};
  StubGravitySource c{"C", 1, Coordinate{0.0, 0.0, 0.1}};

  const StubGravitySource* sequence[] = {&a, &b, &c};
  for (const auto* zone : sequence)
  {
    resolver.addZone(zone);
    expectUnitOrZero(resolver.getGravityDirection());
    resolver.update(0.02);
    expectUnitOrZero(resolver.getGravityDirection());
  }
  for (const auto* zone : sequence)
  {
    resolver.removeZone(zone);
    expectUnitOrZero(resolver.getGravityDirection());
    expectUnitOrZero(resolver.getEffectiveDirection());
    EXPECT_FALSE(resolver.getEffectiveDirection().isExactlyZero());
  }
}

// ============================================================================
// Re-orientation
// ============================================================================

TEST(GravityResolverTest, AddZone_FloorThenForwardWall_SnapsOnceWithOneEvent)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource floor{"floor", 0, kDown};
  StubGravitySource wall{"wall", 1, kForward};

  resolver.addZone(&floor);
  resolver.addZone(&wall);

  ASSERT_EQ(log.started.size(), 1u);
  expectVectorNear(log.started[0].from, kDown);
  expectVectorNear(log.started[0].to, kForward);
  EXPECT_DOUBLE_EQ(log.started[0].duration, 0.0);
  ASSERT_EQ(log.completed.size(), 1u);
  expectVectorNear(body.getUp(), Coordinate{0.0, 0.0, 1.0});
  EXPECT_TRUE(resolver.isTransitioning());

  for (int i = 0; i < 15; ++i)
  {
    resolver.update(0.02);
  }

  EXPECT_EQ(log.started.size(), 1u);
  EXPECT_EQ(log.completed.size(), 1u);
  EXPECT_FALSE(resolver.isTransitioning());
  expectVectorNear(body.getUp(), Coordinate{0.0, 0.0, 1.0});
}

TEST(GravityResolverTest, Snap_ForwardOnNewPlane_IsPreserved)
{
  // Yawed 90 degrees: facing +X
  RigidBody body{1.0,
                 Coordinate{},
                 Eigen::Quaterniond{
                   Eigen::AngleAxisd{std::numbers::pi / 2.0,
                                     Eigen::Vector3d::UnitY()}}};
  GravityResolver resolver{&body};
  StubGravitySource wall{"wall", 0, Coordinate{0.0, 0.0, 1.0}};

  resolver.addZone(&wall);

  expectVectorNear(body.getUp(), Coordinate{0.0, 0.0, -1.0});
  expectVectorNear(body.getForward(), Coordinate{1.0, 0.0, 0.0});
}

TEST(GravityResolverTest, Snap_ForwardAlongNewUp_UsesShortestArc)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  StubGravitySource wall{"wall", 0, kForward};

  resolver.addZone(&wall);

  // Facing +Z with up becoming +Z: pitch back by 90 degrees
  expectVectorNear(body.getUp(), Coordinate{0.0, 0.0, 1.0});
  expectVectorNear(body.getForward(), Coordinate{0.0, -1.0, 0.0});
}

TEST(GravityResolverTest, Update_SmallDirectionChange_SlerpsWithoutEvent)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource zone{"zone", 0, kDown};
  resolver.addZone(&zone);

  // Tilt "down" by one degree about Z
  const double tilt = degToRad(1.0);
  zone.setDirection(Coordinate{std::sin(tilt), -std::cos(tilt), 0.0});
  resolver.update(0.02);

  EXPECT_TRUE(log.started.empty());
  const Coordinate targetUp{-std::sin(tilt), std::cos(tilt), 0.0};
  // 15/s * 0.02 s = 30% of the remaining arc
  EXPECT_NEAR(VectorMath::angleBetweenDeg(body.getUp(), targetUp), 0.7, 1e-6);
}

TEST(GravityResolverTest, Update_SourceDirectionJumps_SnapsAndNotifies)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource zone{"zone", 0, kDown};
  resolver.addZone(&zone);

  zone.setDirection(kSide);
  resolver.update(0.02);

  ASSERT_EQ(log.started.size(), 1u);
  expectVectorNear(log.started[0].to, kSide);
  expectVectorNear(body.getUp(), Coordinate{-1.0, 0.0, 0.0});
}

TEST(GravityResolverTest, ForceAlign_Unchanged_IsNoOp)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource zone{"zone", 0, kDown};
  resolver.addZone(&zone);

  resolver.forceAlign(false);
  resolver.forceAlign(true);

  EXPECT_TRUE(log.started.empty());
  EXPECT_FALSE(resolver.isTransitioning());
}

TEST(GravityResolverTest, TransitionProgress_AfterSnap_AdvancesOverGraceWindow)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  StubGravitySource zone{"zone", 0, kSide};
  resolver.addZone(&zone);

  EXPECT_TRUE(resolver.isTransitioning());
  EXPECT_DOUBLE_EQ(resolver.getTransitionProgress(), 0.0);

  resolver.update(0.125);
  EXPECT_NEAR(resolver.getTransitionProgress(), 0.5, 1e-12);

  resolver.update(0.125);
  EXPECT_FALSE(resolver.isTransitioning());
  EXPECT_DOUBLE_EQ(resolver.getTransitionProgress(), 1.0);
}

// ============================================================================
// Acceleration
// ============================================================================

TEST(GravityResolverTest, Update_InZone_AppliesDirectionTimesMagnitude)
{
  RigidBody body{1.0};
  GravityResolver::Config config;
  config.gravityMagnitude = 20.0;
  GravityResolver resolver{&body, config};
  StubGravitySource zone{"zone", 0, kDown};
  resolver.addZone(&zone);

  resolver.update(0.02);

  expectVectorNear(body.getAccumulatedAcceleration(),
                   Coordinate{0.0, -20.0, 0.0});
}

TEST(GravityResolverTest, Update_NegativeDt_TreatedAsZero)
{
  GravityResolver resolver{nullptr};

  resolver.update(-1.0);

  EXPECT_DOUBLE_EQ(resolver.getSimTime(), 0.0);
}

TEST(GravityResolverTest, NullBody_MembershipAndEventsStillWork)
{
  GravityResolver resolver{nullptr};
  GravityEventLog log;
  log.attach(resolver);
  StubGravitySource floor{"floor", 0, kDown};
  StubGravitySource wall{"wall", 1, kSide};

  resolver.addZone(&floor);
  resolver.addZone(&wall);
  resolver.update(0.02);

  EXPECT_EQ(log.started.size(), 1u);
  EXPECT_EQ(resolver.getBody(), nullptr);
  expectVectorNear(resolver.getGravityDirection(), kSide);
}

// ============================================================================
// Queries
// ============================================================================

TEST(GravityResolverTest, IsNormalWalkable_RelativeToGravityUp)
{
  GravityResolver resolver{nullptr};
  StubGravitySource zone{"zone", 0, kDown};
  resolver.addZone(&zone);

  const double slope30 = degToRad(30.0);
  const double slope60 = degToRad(60.0);

  EXPECT_TRUE(resolver.isNormalWalkable(Coordinate{0.0, 1.0, 0.0}, 46.0));
  EXPECT_TRUE(resolver.isNormalWalkable(
    Coordinate{0.0, std::cos(slope30), -std::sin(slope30)}, 46.0));
  EXPECT_FALSE(resolver.isNormalWalkable(
    Coordinate{0.0, std::cos(slope60), -std::sin(slope60)}, 46.0));
  EXPECT_FALSE(resolver.isNormalWalkable(Coordinate{0.0, 0.0, 0.0}, 46.0));
}

TEST(GravityResolverTest, GetCommandedUp_FollowsOrientingZones)
{
  GravityResolver resolver{nullptr};
  StubGravitySource zone{"zone", 0, kSide};
  resolver.addZone(&zone);

  const auto up = resolver.getCommandedUp();
  ASSERT_TRUE(up.has_value());
  expectVectorNear(*up, Coordinate{-1.0, 0.0, 0.0});
}

TEST(GravityResolverTest, PreserveWorldForward_FacesDirectionOnCurrentPlane)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  StubGravitySource zone{"zone", 0, kDown};
  resolver.addZone(&zone);

  resolver.preserveWorldForward(Coordinate{2.0, 1.0, 0.0});

  expectVectorNear(body.getForward(), Coordinate{1.0, 0.0, 0.0});
  expectVectorNear(body.getUp(), Coordinate{0.0, 1.0, 0.0});
}

TEST(GravityResolverTest, PreserveWorldForward_ParallelToUp_IsIgnored)
{
  RigidBody body{1.0};
  GravityResolver resolver{&body};

  resolver.preserveWorldForward(Coordinate{0.0, 3.0, 0.0});

  EXPECT_TRUE(body.getOrientation().isApprox(Eigen::Quaterniond::Identity()));
}
