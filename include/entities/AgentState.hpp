/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_STATE_HPP
#define AGENT_STATE_HPP

#include "utils/Vector3D.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>

namespace Wayfinder {

enum class MotionState : uint8_t {
    Idle,       // No usable path, paused, or reset
    Walking,    // Advancing along the path each update
    Completed   // Reached the final waypoint; terminal until reset or a new path
};

// Stream operator for MotionState (for Boost.Test)
inline std::ostream& operator<<(std::ostream& os, MotionState state) {
    switch (state) {
    case MotionState::Idle:
        return os << "Idle";
    case MotionState::Walking:
        return os << "Walking";
    case MotionState::Completed:
        return os << "Completed";
    }
    return os << "Unknown";
}

/**
 * @brief Kinematic state of one animated agent
 *
 * While Walking, segmentIndex < waypointCount - 1 and position is the lerp
 * of the current segment at segmentProgress.
 */
struct AgentState {
    size_t segmentIndex{0};
    float segmentProgress{0.0f};    // [0,1)
    Vector3D position;
    float yaw{0.0f};                // radians about +Y, atan2(dx, dz)
    MotionState motionState{MotionState::Idle};
};

} // namespace Wayfinder

#endif // AGENT_STATE_HPP
