/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/WalkerController.hpp"
#include "core/Logger.hpp"
#include "entities/IAgentVisual.hpp"
#include "managers/SettingsManager.hpp"
#include <cmath>
#include <format>

namespace Wayfinder {

WalkerController::WalkerController(IAgentVisual& visual, ICameraSink& camera,
                                   IOrbitTarget& orbitTarget)
    : m_visual(visual)
    , m_animator(visual)
    , m_cameraFollow(camera, orbitTarget)
{
    m_animator.setOnProgress([this](size_t waypointIndex, size_t totalWaypoints) {
        publishStatus(std::format("Walking progress: {}/{} steps",
                                  waypointIndex, totalWaypoints - 1));
        if (m_onProgress) {
            m_onProgress(waypointIndex, totalWaypoints);
        }
    });

    m_animator.setOnComplete([this]() {
        publishStatus("Walking animation completed!");
        if (m_onComplete) {
            m_onComplete();
        }
    });
}

PathAnimator::Result WalkerController::setPath(const std::vector<Vector3D>& waypoints) {
    const PathAnimator::Result result = m_animator.setPath(waypoints);
    if (result == PathAnimator::Result::Success) {
        publishStatus("Walking path set. Use controls to start animation.");
    }
    return result;
}

PathAnimator::Result WalkerController::startWalking() {
    const PathAnimator::Result result = m_animator.start();
    if (result == PathAnimator::Result::Success) {
        m_cameraFollow.enable();
        publishStatus("Walking animation started! Camera following enabled.");
    }
    return result;
}

PathAnimator::Result WalkerController::resumeWalking() {
    const PathAnimator::Result result = m_animator.resume();
    if (result == PathAnimator::Result::Success) {
        m_cameraFollow.enable();
        publishStatus("Walking animation resumed! Camera following enabled.");
    }
    return result;
}

PathAnimator::Result WalkerController::startOrResumeWalking() {
    return m_animator.isAtStart() ? startWalking() : resumeWalking();
}

void WalkerController::stopWalking() {
    m_animator.stop();
    m_cameraFollow.disable();
    publishStatus("Walking animation stopped. Camera following disabled.");
}

PathAnimator::Result WalkerController::resetPosition() {
    const PathAnimator::Result result = m_animator.resetPosition();
    if (result == PathAnimator::Result::Success) {
        publishStatus("Walker reset to starting position.");
    }
    return result;
}

void WalkerController::hideWalker() {
    m_animator.hide();
    publishStatus("Walker hidden.");
}

void WalkerController::showWalker() {
    m_animator.show();
    publishStatus("Walker shown.");
}

bool WalkerController::setWalkSpeed(float speed) {
    if (!m_animator.setSpeed(speed)) {
        return false;
    }
    publishStatus(std::format("Walking speed set to {:.1f}", m_animator.getSpeed()));
    return true;
}

void WalkerController::enableCameraFollow() {
    m_cameraFollow.enable();
    publishStatus("Camera following enabled.");
}

void WalkerController::disableCameraFollow() {
    m_cameraFollow.disable();
    publishStatus("Camera following disabled.");
}

bool WalkerController::setCameraOffset(const Vector3D& offset) {
    if (!m_cameraFollow.setOffset(offset)) {
        return false;
    }
    publishStatus(std::format("Camera offset updated: x={}, y={}, z={}",
                              offset.getX(), offset.getY(), offset.getZ()));
    return true;
}

void WalkerController::syncCamera(const Vector3D& cameraPosition, const Vector3D& lookAt) {
    m_cameraFollow.syncTo(cameraPosition, lookAt);
}

bool WalkerController::applySettings(const SettingsManager& settings) {
    bool allAccepted = true;

    if (settings.has("walker", "speed")) {
        allAccepted &= m_animator.setSpeed(
            settings.get<float>("walker", "speed", m_animator.getSpeed()));
    }

    CameraFollowController::Config camera = m_cameraFollow.getConfig();
    camera.offset.setX(settings.get<float>("camera", "offset_x", camera.offset.getX()));
    camera.offset.setY(settings.get<float>("camera", "offset_y", camera.offset.getY()));
    camera.offset.setZ(settings.get<float>("camera", "offset_z", camera.offset.getZ()));
    camera.lookAtHeight = settings.get<float>("camera", "look_at_height", camera.lookAtHeight);
    camera.smoothingRate = settings.get<float>("camera", "smoothing_rate", camera.smoothingRate);
    allAccepted &= m_cameraFollow.setConfig(camera);

    GaitSynthesizer::Config gait = m_gait.getConfig();
    gait.baseBodyHeight = settings.get<float>("gait", "base_body_height", gait.baseBodyHeight);
    gait.baseHeadHeight = settings.get<float>("gait", "base_head_height", gait.baseHeadHeight);
    gait.walkBobAmplitude = settings.get<float>("gait", "walk_bob_amplitude", gait.walkBobAmplitude);
    gait.armSwingAmplitude = settings.get<float>("gait", "arm_swing_amplitude", gait.armSwingAmplitude);
    gait.legSwingAmplitude = settings.get<float>("gait", "leg_swing_amplitude", gait.legSwingAmplitude);
    gait.idleBobAmplitude = settings.get<float>("gait", "idle_bob_amplitude", gait.idleBobAmplitude);
    gait.walkCycleRate = settings.get<float>("gait", "walk_cycle_rate", gait.walkCycleRate);
    allAccepted &= m_gait.setConfig(gait);

    if (settings.get<bool>("camera", "follow_enabled", m_cameraFollow.isEnabled())) {
        m_cameraFollow.enable();
    } else {
        m_cameraFollow.disable();
    }

    if (allAccepted) {
        WALKER_INFO(std::format("Settings applied: speed {:.2f}, camera offset ({}, {}, {})",
                                m_animator.getSpeed(), camera.offset.getX(),
                                camera.offset.getY(), camera.offset.getZ()));
    } else {
        WALKER_WARN("Some walker settings were rejected, previous values kept");
    }
    return allAccepted;
}

void WalkerController::update(float deltaTime) {
    // Hold the last pose; NaN would reach the gait phase otherwise
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        WALKER_WARN(std::format("Ignoring invalid deltaTime {}", deltaTime));
        return;
    }

    m_animator.update(deltaTime);
    m_elapsedTime += deltaTime;

    m_visual.applyGaitPose(m_gait.synthesize(m_animator.getMotionState(), m_elapsedTime,
                                             deltaTime, m_animator.getSpeed()));

    m_cameraFollow.update(deltaTime, m_animator.getPosition(), m_animator.getYaw());
}

void WalkerController::publishStatus(const std::string& status) {
    m_lastStatus = status;
    WALKER_DEBUG(status);
    if (m_onStatus) {
        m_onStatus(status);
    }
}

} // namespace Wayfinder
