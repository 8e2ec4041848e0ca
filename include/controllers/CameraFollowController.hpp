/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CAMERA_FOLLOW_CONTROLLER_HPP
#define CAMERA_FOLLOW_CONTROLLER_HPP

#include "utils/Vector3D.hpp"
#include <cmath>

namespace Wayfinder {

class ICameraSink;
class IOrbitTarget;

/**
 * @brief Third-person chase camera that trails a walking agent
 *
 * Each enabled tick the configured offset is rotated by the agent's yaw,
 * the desired camera position and look-at point are computed, and the
 * smoothed pose is moved toward them by min(deltaTime * smoothingRate, 1).
 * Disabling freezes the last smoothed pose; nothing is written while disabled.
 *
 * The controller only reads the agent pose it is handed. Camera and orbit
 * sinks are owned by the host and must outlive the controller.
 */
class CameraFollowController {
public:
    struct Config {
        Vector3D offset{0.0f, 2.0f, -3.0f};   // agent-local: above and behind
        float lookAtHeight{0.3f};             // chest level above the agent root
        float smoothingRate{8.0f};            // per second

        bool isValid() const {
            return offset.isFinite() && std::isfinite(lookAtHeight) &&
                   std::isfinite(smoothingRate) && smoothingRate > 0.0f;
        }
    };

    CameraFollowController(ICameraSink& camera, IOrbitTarget& orbitTarget);
    CameraFollowController(ICameraSink& camera, IOrbitTarget& orbitTarget,
                           const Config& config);

    // Non-copyable (holds sink references)
    CameraFollowController(const CameraFollowController&) = delete;
    CameraFollowController& operator=(const CameraFollowController&) = delete;

    /**
     * @brief Moves the camera one smoothing step toward the agent
     * @param deltaTime Frame time in seconds
     * @param agentPosition Agent root in world space
     * @param agentYaw Agent heading about +Y in radians
     */
    void update(float deltaTime, const Vector3D& agentPosition, float agentYaw);

    void enable();
    void disable();
    bool isEnabled() const { return m_enabled; }

    /**
     * @brief Seeds the smoothed pose from the host camera's current state
     *
     * Call when the host moved the camera itself (orbit controls, model
     * framing) so the next follow tick starts from where the camera is.
     * Without a sync the first enabled tick places the camera directly on
     * the desired pose.
     */
    void syncTo(const Vector3D& cameraPosition, const Vector3D& lookAt);

    /**
     * @brief Sets the agent-local camera offset
     * @return false if the offset is not finite
     */
    bool setOffset(const Vector3D& offset);
    const Vector3D& getOffset() const { return m_config.offset; }

    bool setConfig(const Config& config);
    const Config& getConfig() const { return m_config; }

    const Vector3D& getSmoothedPosition() const { return m_smoothedPosition; }
    const Vector3D& getSmoothedLookAt() const { return m_smoothedLookAt; }

    // Pose the camera would reach with a smoothing factor of 1
    Vector3D desiredCameraPosition(const Vector3D& agentPosition, float agentYaw) const;
    Vector3D desiredLookAt(const Vector3D& agentPosition) const;

    float smoothingFactor(float deltaTime) const;

private:
    ICameraSink& m_camera;
    IOrbitTarget& m_orbitTarget;
    Config m_config{};
    bool m_enabled{false};
    Vector3D m_smoothedPosition;
    Vector3D m_smoothedLookAt;
    bool m_hasSmoothedPose{false};
};

} // namespace Wayfinder

#endif // CAMERA_FOLLOW_CONTROLLER_HPP
