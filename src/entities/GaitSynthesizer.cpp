/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/GaitSynthesizer.hpp"
#include "core/Logger.hpp"
#include <cmath>

namespace Wayfinder {

bool GaitSynthesizer::Config::isValid() const {
    const float values[] = {baseBodyHeight, baseHeadHeight, walkBobAmplitude,
                            armSwingAmplitude, legSwingAmplitude, idleBobAmplitude,
                            walkCycleRate, referenceFrameRate};
    for (float v : values) {
        if (!std::isfinite(v)) {
            return false;
        }
    }
    if (walkBobAmplitude <= 0.0f || idleBobAmplitude < 0.0f) {
        return false;
    }
    if (idleBobAmplitude >= walkBobAmplitude) {
        return false;
    }
    return armSwingAmplitude >= 0.0f && legSwingAmplitude >= 0.0f &&
           walkCycleRate > 0.0f && referenceFrameRate > 0.0f;
}

GaitSynthesizer::GaitSynthesizer(const Config& config) : m_config(config) {
    if (!m_config.isValid()) {
        GAIT_WARN("Invalid gait configuration provided, using defaults");
        m_config = Config{};
    }
}

GaitPose GaitSynthesizer::synthesize(MotionState state, float elapsedTime, float deltaTime,
                                     float walkSpeed) const {
    if (state == MotionState::Walking) {
        return walkingPose(elapsedTime, deltaTime, walkSpeed);
    }
    return idlePose(elapsedTime);
}

float GaitSynthesizer::walkPhase(float elapsedTime, float deltaTime, float walkSpeed) const {
    return elapsedTime * m_config.walkCycleRate * walkSpeed * deltaTime *
           m_config.referenceFrameRate;
}

GaitPose GaitSynthesizer::walkingPose(float elapsedTime, float deltaTime, float walkSpeed) const {
    const float cycle = std::sin(walkPhase(elapsedTime, deltaTime, walkSpeed));
    const float bob = std::abs(cycle) * m_config.walkBobAmplitude;

    GaitPose pose;
    pose.bodyLift = m_config.baseBodyHeight + bob;
    pose.headLift = m_config.baseHeadHeight + bob;
    // Arms and legs swing in antiphase, left leads
    pose.leftArmAngle = cycle * m_config.armSwingAmplitude;
    pose.rightArmAngle = -cycle * m_config.armSwingAmplitude;
    pose.leftLegAngle = cycle * m_config.legSwingAmplitude;
    pose.rightLegAngle = -cycle * m_config.legSwingAmplitude;
    return pose;
}

GaitPose GaitSynthesizer::idlePose(float elapsedTime) const {
    const float bob = std::sin(elapsedTime) * m_config.idleBobAmplitude;

    GaitPose pose;
    pose.bodyLift = m_config.baseBodyHeight + bob;
    pose.headLift = m_config.baseHeadHeight + bob;
    return pose;
}

bool GaitSynthesizer::setConfig(const Config& config) {
    if (!config.isValid()) {
        GAIT_WARN("Rejected invalid gait configuration");
        return false;
    }
    m_config = config;
    return true;
}

} // namespace Wayfinder
