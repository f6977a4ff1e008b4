// Ticket: 0004_gravity_resolver
// Ticket: 0006_deferred_zone_membership

#ifndef ORB_SIM_PHYSICS_GRAVITY_RESOLVER_HPP
#define ORB_SIM_PHYSICS_GRAVITY_RESOLVER_HPP

#include <Eigen/Geometry>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "orb-sim/src/DataTypes/Coordinate.hpp"
#include "orb-sim/src/Physics/Gravity/GravitySource.hpp"

namespace orb_sim
{

class RigidBody;

/**
 * @brief Whether the body is mid-way through a gravity re-orientation
 *
 * Transitioning is raised when an alignment begins and cleared when its
 * window expires or completeTransition() is called. Camera and movement code
 * read it to suppress input-relative corrections while "up" is moving.
 */
enum class OrientationState : uint8_t
{
  Stable,
  Transitioning
};

/**
 * @brief Kind of zone membership change an external system has postponed
 */
enum class PendingChangeKind : uint8_t
{
  Add,
  Remove
};

/**
 * @brief Per-body gravity direction resolver and orientation driver
 *
 * Maintains the set of gravity sources currently influencing one body,
 * resolves the effective "down" from the highest-priority source, applies
 * gravitational acceleration and rotates the body so that its local up
 * opposes gravity.
 *
 * Direction resolution:
 * - Active zones are kept in insertion order and stable-sorted ascending by
 *   priority; the last element wins, so among equal priorities the most
 *   recently added zone dominates.
 * - Fixed-direction sources take precedence for the applied acceleration but
 *   never rotate the body.
 * - The resolved direction is either unit length or exactly zero. Zero means
 *   no zone is active: the body is "in space".
 *
 * Orientation:
 * - A change between the previously applied direction and the newly resolved
 *   one with dot < Config::directionChangeDot is a big change and snaps the
 *   body (or starts a timed smooth transition when requested and enabled).
 *   Smaller changes are followed by a bounded slerp each step.
 * - Re-orientation keeps the body's world-forward projected onto the new
 *   horizontal plane, so changing gravity never yaws the body.
 * - In space the body keeps the last planetary up (-lastValidDirection) when
 *   Config::maintainOrientationInSpace is set; otherwise its orientation is
 *   left free.
 *
 * Failure semantics: nothing here throws after construction. A null body
 * turns every body mutation into a no-op while direction bookkeeping and
 * notifications continue; null zones are ignored with a warning; degenerate
 * zone directions are replaced by Config::worldDown.
 *
 * Thread safety: Not thread-safe. All calls, including listener callbacks,
 * happen on the simulation thread.
 *
 * @ticket 0004_gravity_resolver
 */
class GravityResolver
{
public:
  /**
   * @brief Per-body tunables
   */
  struct Config
  {
    double gravityMagnitude{9.81};       // Applied acceleration [m/s^2]
    double gradualAlignmentSpeed{15.0};  // Slerp fraction per second
    double gravityTransitionSpeed{1.0};  // Smooth transition lasts 1/speed [s]
    bool useGradualTransitions{false};   // Smooth instead of snap on zone edges
    bool maintainOrientationInSpace{true};
    double spaceGravityMagnitude{0.0};  // Residual pull in space [m/s^2]
    bool processGravityDuringDash{true};
    double directionChangeDot{0.999};     // Below this a change is "big"
    double transitionGraceWindow{0.25};   // Transitioning after a snap [s]
    double pendingChangeTimeout{2.0};     // Safety timeout for deferrals [s]
    Coordinate worldDown{0.0, -1.0, 0.0};  // Fallback "down"

    /**
     * @brief Check every field is in range
     * @throws std::invalid_argument naming the offending field
     */
    void validate() const;
  };

  using ListenerId = uint32_t;

  /// (oldDirection, newDirection, transitionDuration [s])
  using GravityChangedListener =
    std::function<void(const Coordinate&, const Coordinate&, double)>;

  /// (enteringSpace, direction)
  using SpaceTransitionListener =
    std::function<void(bool, const Coordinate&)>;

  /**
   * @brief Construct a resolver for a body
   *
   * The resolver starts in space with lastValidDirection = world down.
   *
   * @param body Body to drive (non-owning, may be null)
   * @param config Tunables
   * @throws std::invalid_argument if config fails validation
   */
  GravityResolver(RigidBody* body, Config config);

  /// Resolver with default tunables
  explicit GravityResolver(RigidBody* body);

  ~GravityResolver() = default;

  // Listeners capture the resolver's address, so it is neither copied nor
  // moved once constructed
  GravityResolver(const GravityResolver&) = delete;
  GravityResolver& operator=(const GravityResolver&) = delete;
  GravityResolver(GravityResolver&&) = delete;
  GravityResolver& operator=(GravityResolver&&) = delete;

  // ===== Zone membership =====

  /**
   * @brief Start being influenced by a zone
   *
   * Ignored if the zone is already active. Otherwise the direction is
   * recomputed, space is left if necessary, and a big direction change
   * triggers forceAlign(true).
   *
   * @param zone Zone to add (non-owning; null is ignored with a warning)
   */
  void addZone(const GravitySource* zone);

  /**
   * @brief Stop being influenced by a zone
   *
   * Ignored if the zone is not active. Emptying the zone set enters space.
   * Removing a zone that was not dominant changes nothing observable.
   *
   * @param zone Zone to remove (null is ignored with a warning)
   */
  void removeZone(const GravitySource* zone);

  [[nodiscard]] bool hasZone(const GravitySource* zone) const;

  [[nodiscard]] size_t getZoneCount() const
  {
    return zones_.size();
  }

  /**
   * @brief Add a source that only contributes acceleration
   *
   * Fixed-direction sources override the acceleration direction but never
   * rotate the body. Duplicates and null are ignored.
   */
  void addFixedDirectionSource(const GravitySource* source);

  void removeFixedDirectionSource(const GravitySource* source);

  // ===== Deferred membership safety net =====

  /**
   * @brief Record that an external system has postponed a membership change
   *
   * If the matching addZone/removeZone has not arrived within
   * Config::pendingChangeTimeout seconds, the resolver applies it itself.
   * A new notification for the same zone replaces the previous one.
   */
  void notifyPendingZoneChange(const GravitySource* zone,
                               PendingChangeKind kind);

  /**
   * @brief Drop the postponed change registered for one zone, if any
   */
  void cancelPendingZoneChange(const GravitySource* zone);

  /**
   * @brief Drop every postponed change without applying it
   */
  void cancelPendingZoneChanges();

  [[nodiscard]] bool hasPendingZoneChange() const
  {
    return !pendingChanges_.empty();
  }

  // ===== Simulation =====

  /**
   * @brief Advance one physics step
   *
   * Applies due safety timeouts and expired transition windows, recomputes
   * the direction, records the last valid direction, applies gravitational
   * acceleration to the body, rotates it and emits space edges.
   *
   * @param dt Timestep [s]; negative values are treated as zero
   */
  void update(double dt);

  /**
   * @brief Re-align the body with the current gravity now
   *
   * No-op if the direction has not changed beyond the threshold since the
   * last alignment. Otherwise starts a smooth transition when useTransition
   * and Config::useGradualTransitions are both set, or snaps.
   *
   * @param useTransition Prefer a timed transition over a snap
   */
  void forceAlign(bool useTransition = false);

  /**
   * @brief Finish the current transition immediately
   *
   * A smooth transition jumps to its target orientation and emits its
   * completion. No-op when Stable.
   */
  void completeTransition();

  /**
   * @brief Face a world direction on the current horizontal plane
   * @param worldForward Desired facing; ignored if parallel to up
   */
  void preserveWorldForward(const Coordinate& worldForward);

  /**
   * @brief Steer the remembered direction while in space
   *
   * Updates lastValidDirection. In space with orientation preservation the
   * body then follows the new up at the gradual alignment rate.
   *
   * @param direction New "down"; ignored if degenerate
   */
  void setSpaceGravityDirection(const Coordinate& direction);

  /**
   * @brief Tell the resolver whether the body is dashing
   *
   * While dashing no gravity acceleration is applied and big direction
   * changes wait for the dash to end before the body snaps.
   */
  void setDashActive(bool dashing)
  {
    dashActive_ = dashing;
  }

  [[nodiscard]] bool isDashActive() const
  {
    return dashActive_;
  }

  // ===== Queries =====

  /**
   * @brief Resolved "down" for the last recomputation; zero in space
   */
  [[nodiscard]] const Coordinate& getGravityDirection() const
  {
    return gravityDirection_;
  }

  /**
   * @brief "Down" guaranteed non-zero
   * @return Current direction, else last valid direction, else world down
   */
  [[nodiscard]] Coordinate getEffectiveDirection() const;

  /**
   * @brief Opposite of getEffectiveDirection()
   */
  [[nodiscard]] Coordinate getGravityUp() const;

  /**
   * @brief Up the body is being driven towards
   * @return -lastValidDirection in space with orientation preservation,
   *         nothing in space without it (orientation is free), otherwise the
   *         opposite of the orienting zones' direction
   */
  [[nodiscard]] std::optional<Coordinate> getCommandedUp() const;

  [[nodiscard]] const Coordinate& getLastValidDirection() const
  {
    return lastValidDirection_;
  }

  [[nodiscard]] bool isInSpace() const
  {
    return inSpace_;
  }

  [[nodiscard]] OrientationState getOrientationState() const
  {
    return orientationState_;
  }

  [[nodiscard]] bool isTransitioning() const
  {
    return orientationState_ == OrientationState::Transitioning;
  }

  /**
   * @brief Fraction of the current transition window elapsed
   * @return Value in [0, 1]; 1 when Stable
   */
  [[nodiscard]] double getTransitionProgress() const;

  /**
   * @brief Whether a surface normal is within maxSlopeDeg of gravity up
   */
  [[nodiscard]] bool isNormalWalkable(const Coordinate& normal,
                                      double maxSlopeDeg) const;

  /**
   * @brief Magnitude of the acceleration applied outside space [m/s^2]
   *
   * The configured magnitude, unless the dominant fixed-direction source
   * supplies its own strength.
   */
  [[nodiscard]] double getGravityMagnitude() const
  {
    return forceMagnitude_;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  [[nodiscard]] const RigidBody* getBody() const
  {
    return body_;
  }

  RigidBody* getBody()
  {
    return body_;
  }

  /**
   * @brief Simulation time accumulated by update() [s]
   */
  [[nodiscard]] double getSimTime() const
  {
    return simTime_;
  }

  // ===== Observers =====

  /**
   * @brief Register a callback for the start of every re-orientation
   * @return Handle for removeListener(); 0 if the callback is empty
   */
  ListenerId addGravityChangedListener(GravityChangedListener listener);

  /**
   * @brief Register a callback for the end of every re-orientation
   */
  ListenerId addTransitionCompletedListener(GravityChangedListener listener);

  /**
   * @brief Register a callback for entering and leaving space
   */
  ListenerId addSpaceTransitionListener(SpaceTransitionListener listener);

  /**
   * @brief Unregister any listener
   * @return true if the handle was registered
   */
  bool removeListener(ListenerId id);

private:
  struct PendingZoneChange
  {
    const GravitySource* zone;
    PendingChangeKind kind;
    double deadline;
  };

  struct SmoothTransition
  {
    Eigen::Quaterniond startOrientation;
    Eigen::Quaterniond targetOrientation;
    double startTime;
    double duration;
    Coordinate fromDirection;
    Coordinate toDirection;
  };

  Coordinate resolve(std::vector<const GravitySource*>& sources);
  void refreshDirection();
  void updateSpaceState();
  void applyGravityAcceleration();
  void alignOrientation(double dt);
  void alignGradually(const Coordinate& targetUp, double dt);
  [[nodiscard]] Eigen::Quaterniond computeTargetOrientation(
    const Coordinate& newUp) const;
  [[nodiscard]] bool isBigChange(const Coordinate& from,
                                 const Coordinate& to) const;

  void snapTo(const Coordinate& direction);
  void beginSmoothTransition(const Coordinate& direction);
  void advanceSmoothTransition();
  void finishTransition();

  /**
   * @brief Report a running smooth transition as completed without applying
   *        its target orientation
   */
  void abandonSmoothTransition();
  void expireTransition();

  void processPendingChanges();
  void clearPendingChange(const GravitySource* zone, PendingChangeKind kind);

  void notifyGravityChanged(const Coordinate& from,
                            const Coordinate& to,
                            double duration) const;
  void notifyTransitionCompleted(const Coordinate& from,
                                 const Coordinate& to,
                                 double duration) const;
  void notifySpaceTransition(bool entering, const Coordinate& direction) const;

  RigidBody* body_;
  Config config_;
  Coordinate worldDown_;  // Normalized Config::worldDown

  std::vector<const GravitySource*> zones_;
  std::vector<const GravitySource*> fixedSources_;
  std::vector<PendingZoneChange> pendingChanges_;

  Coordinate gravityDirection_;    // Zero or unit; fixed sources included
  Coordinate orientingDirection_;  // Zero or unit; zones only
  Coordinate lastValidDirection_;
  Coordinate lastAppliedDirection_;
  double forceMagnitude_{0.0};  // [m/s^2]

  bool inSpace_{true};
  bool spaceSteering_{false};
  bool dashActive_{false};

  OrientationState orientationState_{OrientationState::Stable};
  double transitionStart_{0.0};
  double transitionDeadline_{0.0};
  std::optional<SmoothTransition> smoothTransition_;

  double simTime_{0.0};

  ListenerId nextListenerId_{1};
  std::vector<std::pair<ListenerId, GravityChangedListener>> changedListeners_;
  std::vector<std::pair<ListenerId, GravityChangedListener>>
    completedListeners_;
  std::vector<std::pair<ListenerId, SpaceTransitionListener>> spaceListeners_;
};

}  // namespace orb_sim

#endif  // ORB_SIM_PHYSICS_GRAVITY_RESOLVER_HPP
