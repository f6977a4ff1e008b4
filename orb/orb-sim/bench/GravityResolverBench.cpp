// Ticket: 0004_gravity_resolver

#include <benchmark/benchmark.h>
#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/Gravity/DirectionalGravityArea.hpp"
#include "orb-sim/src/Physics/Gravity/GravityResolver.hpp"
#include "orb-sim/src/Physics/Gravity/SphericalGravityArea.hpp"
#include "orb-sim/src/Physics/RigidBody/RigidBody.hpp"

using namespace orb_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Overlapping directional zones with random priorities and directions
std::vector<std::unique_ptr<DirectionalGravityArea>> generateZones(size_t count)
{
  static std::mt19937 rng{42};  // Fixed seed for deterministic benchmarks
  std::uniform_real_distribution<double> dir{-1.0, 1.0};
  std::uniform_int_distribution<int> priority{0, 10};

  std::vector<std::unique_ptr<DirectionalGravityArea>> zones;
  zones.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    zones.push_back(std::make_unique<DirectionalGravityArea>(
      "zone" + std::to_string(i),
      priority(rng),
      Coordinate{-10.0, -10.0, -10.0},
      Coordinate{10.0, 10.0, 10.0},
      Coordinate{dir(rng), dir(rng) - 2.0, dir(rng)}));
  }
  return zones;
}

}  // namespace

// ============================================================================
// Step Benchmarks
// ============================================================================

/**
 * @brief One resolver step with N overlapping zones active
 *
 * Covers priority resolution, acceleration and gradual alignment.
 */
static void BM_GravityResolver_UpdateWithZones(benchmark::State& state)
{
  const auto count = static_cast<size_t>(state.range(0));
  auto zones = generateZones(count);

  RigidBody body{1.0};
  GravityResolver resolver{&body};
  for (const auto& zone : zones)
  {
    resolver.addZone(zone.get());
  }

  for (auto _ : state)
  {
    resolver.update(0.02);
    benchmark::DoNotOptimize(body.consumeAccumulatedAcceleration());
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_GravityResolver_UpdateWithZones)
  ->Arg(1)
  ->Arg(4)
  ->Arg(16)
  ->Arg(64)
  ->Complexity();

/**
 * @brief Resolver step while orbiting a spherical area
 *
 * The direction changes slightly every step, so every step slerps.
 */
static void BM_GravityResolver_OrbitSpherical(benchmark::State& state)
{
  SphericalGravityArea planet{"planet", 0, Coordinate{0.0, 0.0, 0.0}, 100.0};
  RigidBody body{1.0, Coordinate{0.0, 20.0, 0.0}};
  GravityResolver resolver{&body};
  resolver.addZone(&planet);

  double angle = 0.0;
  for (auto _ : state)
  {
    angle += 0.001;
    body.setPosition(
      Coordinate{20.0 * std::sin(angle), 20.0 * std::cos(angle), 0.0});
    resolver.update(0.02);
    benchmark::DoNotOptimize(body.getOrientation());
  }
}
BENCHMARK(BM_GravityResolver_OrbitSpherical);

// ============================================================================
// Membership Benchmarks
// ============================================================================

/**
 * @brief Add then remove a zone that flips gravity (snap both ways)
 */
static void BM_GravityResolver_ZoneFlip(benchmark::State& state)
{
  DirectionalGravityArea floor{"floor",
                               0,
                               Coordinate{-1.0, -1.0, -1.0},
                               Coordinate{1.0, 1.0, 1.0},
                               Coordinate{0.0, -1.0, 0.0}};
  DirectionalGravityArea wall{"wall",
                              1,
                              Coordinate{-1.0, -1.0, -1.0},
                              Coordinate{1.0, 1.0, 1.0},
                              Coordinate{1.0, 0.0, 0.0}};
  RigidBody body{1.0};
  GravityResolver resolver{&body};
  resolver.addZone(&floor);

  for (auto _ : state)
  {
    resolver.addZone(&wall);
    resolver.removeZone(&wall);
    benchmark::DoNotOptimize(body.getOrientation());
  }
}
BENCHMARK(BM_GravityResolver_ZoneFlip);

BENCHMARK_MAIN();
