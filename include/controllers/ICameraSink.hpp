/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ICAMERA_SINK_HPP
#define ICAMERA_SINK_HPP

/**
 * @file ICameraSink.hpp
 * @brief Write-only sinks for the host's perspective camera and orbit controls
 *
 * CameraFollowController is the only writer while following is enabled.
 */

#include "utils/Vector3D.hpp"

namespace Wayfinder {

class ICameraSink
{
public:
    virtual ~ICameraSink() = default;

    virtual void setPosition(const Vector3D& position) = 0;

    // Orients the camera toward a world-space point
    virtual void lookAt(const Vector3D& target) = 0;
};

class IOrbitTarget
{
public:
    virtual ~IOrbitTarget() = default;

    // Pivot point of the host's orbit controls
    virtual void setTarget(const Vector3D& target) = 0;
};

} // namespace Wayfinder

#endif // ICAMERA_SINK_HPP
