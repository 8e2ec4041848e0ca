/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/CameraFollowController.hpp"
#include "controllers/ICameraSink.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace Wayfinder {

CameraFollowController::CameraFollowController(ICameraSink& camera, IOrbitTarget& orbitTarget)
    : m_camera(camera), m_orbitTarget(orbitTarget) {}

CameraFollowController::CameraFollowController(ICameraSink& camera, IOrbitTarget& orbitTarget,
                                               const Config& config)
    : m_camera(camera), m_orbitTarget(orbitTarget), m_config(config) {
    if (!m_config.isValid()) {
        FOLLOWCAM_WARN("Invalid camera follow configuration provided, using defaults");
        m_config = Config{};
    }
}

void CameraFollowController::update(float deltaTime, const Vector3D& agentPosition,
                                    float agentYaw) {
    if (!m_enabled) {
        return;
    }
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        FOLLOWCAM_WARN(std::format("Ignoring invalid deltaTime {}", deltaTime));
        return;
    }

    const Vector3D targetPosition = desiredCameraPosition(agentPosition, agentYaw);
    const Vector3D targetLookAt = desiredLookAt(agentPosition);

    // Never synced: start on the agent instead of sweeping in from the origin
    if (!m_hasSmoothedPose) {
        m_smoothedPosition = targetPosition;
        m_smoothedLookAt = targetLookAt;
        m_hasSmoothedPose = true;
    } else {
        const float smoothing = smoothingFactor(deltaTime);
        m_smoothedPosition = Vector3D::lerp(m_smoothedPosition, targetPosition, smoothing);
        m_smoothedLookAt = Vector3D::lerp(m_smoothedLookAt, targetLookAt, smoothing);
    }

    m_camera.setPosition(m_smoothedPosition);
    m_camera.lookAt(m_smoothedLookAt);
    m_orbitTarget.setTarget(m_smoothedLookAt);
}

void CameraFollowController::enable() {
    if (!m_enabled) {
        m_enabled = true;
        FOLLOWCAM_INFO("Camera following enabled");
    }
}

void CameraFollowController::disable() {
    if (m_enabled) {
        m_enabled = false;
        FOLLOWCAM_INFO("Camera following disabled");
    }
}

void CameraFollowController::syncTo(const Vector3D& cameraPosition, const Vector3D& lookAt) {
    if (!cameraPosition.isFinite() || !lookAt.isFinite()) {
        FOLLOWCAM_WARN("Ignoring non-finite camera pose");
        return;
    }
    m_smoothedPosition = cameraPosition;
    m_smoothedLookAt = lookAt;
    m_hasSmoothedPose = true;
}

bool CameraFollowController::setOffset(const Vector3D& offset) {
    if (!offset.isFinite()) {
        FOLLOWCAM_WARN("Rejected non-finite camera offset");
        return false;
    }
    m_config.offset = offset;
    FOLLOWCAM_DEBUG(std::format("Camera offset updated: x={}, y={}, z={}",
                                offset.getX(), offset.getY(), offset.getZ()));
    return true;
}

bool CameraFollowController::setConfig(const Config& config) {
    if (!config.isValid()) {
        FOLLOWCAM_WARN("Rejected invalid camera follow configuration");
        return false;
    }
    m_config = config;
    return true;
}

Vector3D CameraFollowController::desiredCameraPosition(const Vector3D& agentPosition,
                                                       float agentYaw) const {
    return agentPosition + m_config.offset.rotatedAboutY(agentYaw);
}

Vector3D CameraFollowController::desiredLookAt(const Vector3D& agentPosition) const {
    return agentPosition + Vector3D(0.0f, m_config.lookAtHeight, 0.0f);
}

float CameraFollowController::smoothingFactor(float deltaTime) const {
    return std::min(deltaTime * m_config.smoothingRate, 1.0f);
}

} // namespace Wayfinder
