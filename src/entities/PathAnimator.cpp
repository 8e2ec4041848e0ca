/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/PathAnimator.hpp"
#include "core/Logger.hpp"
#include "entities/IAgentVisual.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Wayfinder {

namespace {
constexpr float YAW_EPSILON{1e-6f};
}

PathAnimator::PathAnimator(IAgentVisual& visual) : m_visual(visual) {
    // Nothing to show until a path arrives
    m_visual.setVisible(false);
}

PathAnimator::Result PathAnimator::setPath(const std::vector<Vector3D>& waypoints) {
    if (waypoints.size() < 2) {
        ANIMATOR_WARN(std::format("Invalid path provided: {} waypoint(s), need at least 2",
                                  waypoints.size()));
        return Result::InvalidPath;
    }
    if (!std::all_of(waypoints.begin(), waypoints.end(),
                     [](const Vector3D& p) { return p.isFinite(); })) {
        ANIMATOR_WARN("Invalid path provided: non-finite waypoint");
        return Result::InvalidPath;
    }

    m_waypoints = waypoints;
    m_state.motionState = MotionState::Idle;
    snapToStart();

    m_visible = true;
    m_visual.setVisible(true);

    ANIMATOR_INFO(std::format("Path set with {} waypoints ({:.2f} units)",
                              m_waypoints.size(), getTotalPathLength()));
    return Result::Success;
}

PathAnimator::Result PathAnimator::start() {
    if (!hasPath()) {
        ANIMATOR_WARN("Cannot start walking: no valid path set");
        return Result::InvalidPath;
    }
    if (m_state.motionState == MotionState::Completed) {
        ANIMATOR_WARN("Cannot start walking: traversal already completed, reset first");
        return Result::TraversalCompleted;
    }

    const bool fromBeginning = isAtStart();
    m_state.motionState = MotionState::Walking;

    // Mid-path start converges with resume
    if (fromBeginning) {
        snapToStart();
        notifyProgress(0);
    }
    return Result::Success;
}

PathAnimator::Result PathAnimator::resume() {
    if (!hasPath()) {
        ANIMATOR_WARN("Cannot resume walking: no valid path set");
        return Result::InvalidPath;
    }
    if (m_state.motionState == MotionState::Completed) {
        ANIMATOR_WARN("Cannot resume walking: traversal already completed, reset first");
        return Result::TraversalCompleted;
    }
    m_state.motionState = MotionState::Walking;
    return Result::Success;
}

void PathAnimator::stop() {
    if (m_state.motionState == MotionState::Walking) {
        m_state.motionState = MotionState::Idle;
        ANIMATOR_DEBUG(std::format("Stopped on segment {} at {:.3f}",
                                   m_state.segmentIndex, m_state.segmentProgress));
    }
}

PathAnimator::Result PathAnimator::resetPosition() {
    if (!hasPath()) {
        ANIMATOR_WARN("Cannot reset position: no valid path set");
        return Result::InvalidPath;
    }
    m_state.motionState = MotionState::Idle;
    snapToStart();
    return Result::Success;
}

void PathAnimator::update(float deltaTime) {
    if (m_state.motionState != MotionState::Walking) {
        return;
    }
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        ANIMATOR_WARN(std::format("Ignoring invalid deltaTime {}", deltaTime));
        return;
    }

    const size_t lastIndex = m_waypoints.size() - 1;
    if (m_state.segmentIndex >= lastIndex) {
        completeTraversal();
        return;
    }

    double remaining = static_cast<double>(m_speed) * deltaTime;
    while (true) {
        const Vector3D& from = m_waypoints[m_state.segmentIndex];
        const Vector3D& to = m_waypoints[m_state.segmentIndex + 1];
        const double segmentLength = segmentLengthAt(m_state.segmentIndex);

        if (segmentLength <= DEGENERATE_SEGMENT_LENGTH) {
            // Zero-length segment: nothing to traverse
            m_state.segmentProgress = 1.0f;
        } else {
            const double needed = segmentLength - m_segmentTravelled;
            if (remaining + PROGRESS_EPSILON * segmentLength >= needed) {
                remaining = std::max(0.0, remaining - needed);
                m_state.segmentProgress = 1.0f;
            } else {
                m_segmentTravelled += remaining;
                m_state.segmentProgress = static_cast<float>(m_segmentTravelled / segmentLength);
                remaining = 0.0;
            }
        }

        if (m_state.segmentProgress < 1.0f) {
            m_state.position = Vector3D::lerp(from, to, m_state.segmentProgress);
            commitTransform();
            return;
        }

        if (m_state.segmentIndex + 1 >= lastIndex) {
            completeTraversal();
            return;
        }

        ++m_state.segmentIndex;
        m_state.segmentProgress = 0.0f;
        m_segmentTravelled = 0.0;
        m_state.position = m_waypoints[m_state.segmentIndex];
        faceNextWaypoint();
        commitTransform();
        notifyProgress(m_state.segmentIndex);

        // A progress listener may have stopped, reset or replaced the path
        if (m_state.motionState != MotionState::Walking || remaining <= 0.0) {
            return;
        }
    }
}

void PathAnimator::show() {
    m_visible = true;
    m_visual.setVisible(true);
}

void PathAnimator::hide() {
    m_visible = false;
    m_visual.setVisible(false);
    // Never animate an agent nobody can see
    stop();
}

bool PathAnimator::setSpeed(float speed) {
    if (!std::isfinite(speed)) {
        ANIMATOR_WARN("Rejected non-finite walking speed");
        return false;
    }
    m_speed = std::max(MIN_SPEED, speed);
    ANIMATOR_DEBUG(std::format("Walking speed set to {:.2f}", m_speed));
    return true;
}

bool PathAnimator::isAtStart() const {
    return m_state.motionState != MotionState::Completed &&
           m_state.segmentIndex == 0 && m_state.segmentProgress == 0.0f;
}

float PathAnimator::getTotalPathLength() const {
    double total = 0.0;
    for (size_t i = 0; i + 1 < m_waypoints.size(); ++i) {
        total += segmentLengthAt(i);
    }
    return static_cast<float>(total);
}

float PathAnimator::getRemainingDistance() const {
    if (!hasPath() || m_state.motionState == MotionState::Completed) {
        return 0.0f;
    }
    double remaining = std::max(0.0, segmentLengthAt(m_state.segmentIndex) - m_segmentTravelled);
    for (size_t i = m_state.segmentIndex + 1; i + 1 < m_waypoints.size(); ++i) {
        remaining += segmentLengthAt(i);
    }
    return static_cast<float>(remaining);
}

double PathAnimator::segmentLengthAt(size_t index) const {
    const Vector3D& a = m_waypoints[index];
    const Vector3D& b = m_waypoints[index + 1];
    const double dx = static_cast<double>(b.getX()) - a.getX();
    const double dy = static_cast<double>(b.getY()) - a.getY();
    const double dz = static_cast<double>(b.getZ()) - a.getZ();
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

void PathAnimator::snapToStart() {
    m_state.segmentIndex = 0;
    m_state.segmentProgress = 0.0f;
    m_segmentTravelled = 0.0;
    m_state.position = m_waypoints.front();
    faceNextWaypoint();
    commitTransform();
}

void PathAnimator::faceNextWaypoint() {
    if (m_state.segmentIndex + 1 >= m_waypoints.size()) {
        return;
    }
    const Vector3D direction =
        m_waypoints[m_state.segmentIndex + 1] - m_waypoints[m_state.segmentIndex];
    // Purely vertical segments have no heading; keep the last one
    if (direction.horizontalLength() <= YAW_EPSILON) {
        return;
    }
    m_state.yaw = std::atan2(direction.getX(), direction.getZ());
}

void PathAnimator::completeTraversal() {
    const size_t lastIndex = m_waypoints.size() - 1;
    m_state.motionState = MotionState::Completed;
    m_state.segmentIndex = lastIndex - 1;
    m_state.segmentProgress = 0.0f;
    m_segmentTravelled = 0.0;
    m_state.position = m_waypoints[lastIndex];
    commitTransform();

    ANIMATOR_INFO("Walking animation completed");
    notifyProgress(lastIndex);
    if (m_onComplete) {
        m_onComplete();
    }
}

void PathAnimator::commitTransform() {
    m_visual.setPosition(m_state.position);
    m_visual.setYaw(m_state.yaw);
}

void PathAnimator::notifyProgress(size_t waypointIndex) {
    if (m_onProgress) {
        m_onProgress(waypointIndex, m_waypoints.size());
    }
}

} // namespace Wayfinder
