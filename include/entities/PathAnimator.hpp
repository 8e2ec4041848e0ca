/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_ANIMATOR_HPP
#define PATH_ANIMATOR_HPP

#include "entities/AgentState.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <functional>
#include <ostream>
#include <utility>
#include <vector>

namespace Wayfinder {

class IAgentVisual;

/**
 * @brief Moves one agent along a finished waypoint sequence, frame by frame
 *
 * State machine: Idle -> Walking -> Completed. The host calls update() once
 * per frame with the elapsed time; no timers run internally. Rejected calls
 * leave the state untouched, log a warning and report a Result.
 *
 * The visual is written through an IAgentVisual reference supplied at
 * construction. The animator never owns it and it must outlive the animator.
 */
class PathAnimator {
public:
    enum class Result {
        Success,
        InvalidPath,        // No path set, or fewer than two waypoints
        TraversalCompleted  // start()/resume() after the end was reached; reset first
    };

    /**
     * @brief Fired when the agent reaches a waypoint
     * @param waypointIndex Index of the waypoint just reached (0 on start)
     * @param totalWaypoints Number of waypoints in the path
     */
    using ProgressCallback = std::function<void(size_t waypointIndex, size_t totalWaypoints)>;

    /**
     * @brief Fired once per traversal when the final waypoint is reached
     */
    using CompletionCallback = std::function<void()>;

    static constexpr float DEFAULT_SPEED{2.0f};       // units per second
    static constexpr float MIN_SPEED{0.1f};
    static constexpr float DEGENERATE_SEGMENT_LENGTH{1e-6f};
    static constexpr float PROGRESS_EPSILON{1e-6f};   // fraction of a segment

    /**
     * @brief Creates an idle animator; the visual is hidden until setPath() succeeds
     * @param visual Sink for position, yaw and visibility
     */
    explicit PathAnimator(IAgentVisual& visual);
    ~PathAnimator() = default;

    // Non-copyable (holds a sink reference and host callbacks)
    PathAnimator(const PathAnimator&) = delete;
    PathAnimator& operator=(const PathAnimator&) = delete;

    /**
     * @brief Accepts a new path and resets the agent to its first waypoint
     * @param waypoints Ordered world-space points, at least two, all finite
     * @return Success, or InvalidPath with the previous state kept
     */
    Result setPath(const std::vector<Vector3D>& waypoints);

    /**
     * @brief Starts walking from the first waypoint
     *
     * Once progress has been made this behaves exactly like resume().
     * At the true beginning it snaps to waypoint 0 and reports progress (0, N).
     */
    Result start();

    /**
     * @brief Continues walking from the current segment and progress
     */
    Result resume();

    /**
     * @brief Pauses in place, keeping segment and progress. Idempotent.
     */
    void stop();

    /**
     * @brief Returns the agent to waypoint 0 without starting it
     */
    Result resetPosition();

    /**
     * @brief Advances the agent by speed * deltaTime world units
     * @param deltaTime Frame time in seconds; no-op unless Walking
     *
     * Distance left over when a waypoint is passed carries into the next
     * segment. Zero-length segments are skipped.
     */
    void update(float deltaTime);

    void show();

    /**
     * @brief Hides the visual and pauses the agent if it was walking
     */
    void hide();

    /**
     * @brief Sets the walking speed, clamped to MIN_SPEED
     * @return false if speed is not finite
     */
    bool setSpeed(float speed);
    float getSpeed() const { return m_speed; }

    void setOnProgress(ProgressCallback callback) { m_onProgress = std::move(callback); }
    void setOnComplete(CompletionCallback callback) { m_onComplete = std::move(callback); }

    const AgentState& getState() const { return m_state; }
    MotionState getMotionState() const { return m_state.motionState; }
    const Vector3D& getPosition() const { return m_state.position; }
    float getYaw() const { return m_state.yaw; }
    size_t getSegmentIndex() const { return m_state.segmentIndex; }
    float getSegmentProgress() const { return m_state.segmentProgress; }

    const std::vector<Vector3D>& getWaypoints() const { return m_waypoints; }
    size_t getWaypointCount() const { return m_waypoints.size(); }
    bool hasPath() const { return m_waypoints.size() >= 2; }

    bool isWalking() const { return m_state.motionState == MotionState::Walking; }
    bool isCompleted() const { return m_state.motionState == MotionState::Completed; }
    bool isVisible() const { return m_visible; }

    /**
     * @brief True at waypoint 0 with no progress on an unfinished traversal
     */
    bool isAtStart() const;

    float getTotalPathLength() const;
    float getRemainingDistance() const;

private:
    IAgentVisual& m_visual;
    std::vector<Vector3D> m_waypoints;
    AgentState m_state{};
    double m_segmentTravelled{0.0};   // world units into the current segment
    float m_speed{DEFAULT_SPEED};
    bool m_visible{false};

    ProgressCallback m_onProgress;
    CompletionCallback m_onComplete;

    double segmentLengthAt(size_t index) const;
    void snapToStart();
    void faceNextWaypoint();
    void completeTraversal();
    void commitTransform();
    void notifyProgress(size_t waypointIndex);
};

// Stream operator for PathAnimator::Result (for Boost.Test)
inline std::ostream& operator<<(std::ostream& os, PathAnimator::Result result) {
    switch (result) {
    case PathAnimator::Result::Success:
        return os << "Success";
    case PathAnimator::Result::InvalidPath:
        return os << "InvalidPath";
    case PathAnimator::Result::TraversalCompleted:
        return os << "TraversalCompleted";
    }
    return os << "Unknown";
}

} // namespace Wayfinder

#endif // PATH_ANIMATOR_HPP
