/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WALKER_CONTROLLER_HPP
#define WALKER_CONTROLLER_HPP

/**
 * @file WalkerController.hpp
 * @brief Host-facing facade for one walking agent and its chase camera
 *
 * Sequences the per-frame work in a fixed order:
 *   1. PathAnimator::update(dt)   - position, yaw, motion state
 *   2. gait clock += dt           - GaitSynthesizer pose applied to the visual
 *   3. CameraFollowController     - reads the agent pose written in step 1
 *
 * Starting or resuming enables camera follow; stopping disables it. Every
 * operation publishes a one-line status message for the host's UI.
 *
 * Usage:
 *   WalkerController walker(visual, camera, orbit);
 *   walker.setStatusCallback([](const std::string& s) { ui.setStatus(s); });
 *   walker.setPath(waypoints);
 *   walker.startOrResumeWalking();
 *   // each frame:
 *   walker.update(deltaTime);
 */

#include "controllers/CameraFollowController.hpp"
#include "controllers/IUpdatable.hpp"
#include "entities/GaitSynthesizer.hpp"
#include "entities/PathAnimator.hpp"
#include "utils/Vector3D.hpp"
#include <functional>
#include <string>
#include <vector>

namespace Wayfinder {

class IAgentVisual;
class ICameraSink;
class IOrbitTarget;
class SettingsManager;

class WalkerController : public IUpdatable
{
public:
    using StatusCallback = std::function<void(const std::string& status)>;

    /**
     * @param visual Agent visual; hidden until a path is set
     * @param camera Host camera written while follow is enabled
     * @param orbitTarget Host orbit controls pivot, kept on the agent while following
     */
    WalkerController(IAgentVisual& visual, ICameraSink& camera, IOrbitTarget& orbitTarget);
    ~WalkerController() override = default;

    WalkerController(const WalkerController&) = delete;
    WalkerController& operator=(const WalkerController&) = delete;

    PathAnimator::Result setPath(const std::vector<Vector3D>& waypoints);

    PathAnimator::Result startWalking();
    PathAnimator::Result resumeWalking();

    /**
     * @brief start() at the beginning of the path, resume() anywhere else
     */
    PathAnimator::Result startOrResumeWalking();

    void stopWalking();
    PathAnimator::Result resetPosition();

    void hideWalker();
    void showWalker();

    bool setWalkSpeed(float speed);

    void enableCameraFollow();
    void disableCameraFollow();
    bool setCameraOffset(const Vector3D& offset);

    /**
     * @brief Seeds the follow camera from the host camera's current pose
     */
    void syncCamera(const Vector3D& cameraPosition, const Vector3D& lookAt);

    /**
     * @brief Reads the "walker", "gait" and "camera" categories
     *
     * Keys that are absent keep their current values. Invalid groups are
     * rejected as a whole and logged.
     * @return true if every group that was present was accepted
     */
    bool applySettings(const SettingsManager& settings);

    void update(float deltaTime) override;

    void setStatusCallback(StatusCallback callback) { m_onStatus = std::move(callback); }

    // Host hooks on top of the status messages
    void setOnProgress(PathAnimator::ProgressCallback callback) { m_onProgress = std::move(callback); }
    void setOnComplete(PathAnimator::CompletionCallback callback) { m_onComplete = std::move(callback); }

    const PathAnimator& getAnimator() const { return m_animator; }
    const CameraFollowController& getCameraFollow() const { return m_cameraFollow; }
    const GaitSynthesizer& getGait() const { return m_gait; }
    float getElapsedTime() const { return m_elapsedTime; }
    const std::string& getLastStatus() const { return m_lastStatus; }

private:
    IAgentVisual& m_visual;
    PathAnimator m_animator;
    CameraFollowController m_cameraFollow;
    GaitSynthesizer m_gait;
    float m_elapsedTime{0.0f};

    StatusCallback m_onStatus;
    PathAnimator::ProgressCallback m_onProgress;
    PathAnimator::CompletionCallback m_onComplete;
    std::string m_lastStatus;

    void publishStatus(const std::string& status);
};

} // namespace Wayfinder

#endif // WALKER_CONTROLLER_HPP
