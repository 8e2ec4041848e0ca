/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IAGENT_VISUAL_HPP
#define IAGENT_VISUAL_HPP

/**
 * @file IAgentVisual.hpp
 * @brief Write-only sink for the walker's on-screen representation
 *
 * Implemented by the host renderer (scene node, mesh group, debug printer).
 * PathAnimator writes the root transform and visibility; WalkerController
 * writes the gait pose. The animation core never owns or creates the visual.
 */

#include "entities/GaitSynthesizer.hpp"
#include "utils/Vector3D.hpp"

namespace Wayfinder {

class IAgentVisual
{
public:
    virtual ~IAgentVisual() = default;

    virtual void setPosition(const Vector3D& position) = 0;

    // Rotation about +Y in radians
    virtual void setYaw(float yaw) = 0;

    virtual void setVisible(bool visible) = 0;

    virtual void applyGaitPose(const GaitPose& pose) = 0;
};

} // namespace Wayfinder

#endif // IAGENT_VISUAL_HPP
