/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <cstdint>
#include <SDL3/SDL.h>

namespace Wayfinder {

/**
 * TimestepManager paces the walkthrough frame loop in real time.
 *
 * Each frame measures the wall-clock delta with SDL's nanosecond ticks and
 * feeds it into a fixed-timestep accumulator, so the animation core always
 * sees the same deltaTime regardless of how long a frame actually took.
 * endFrame() sleeps with SDL_DelayPrecise until the target frame time has elapsed.
 */
class TimestepManager {
public:
    /**
     * Constructor
     * @param targetFPS Target frames per second (e.g., 60.0f)
     * @param fixedTimestep Fixed timestep for updates in seconds (e.g., 1.0f/60.0f)
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Returns true while a fixed update is owed for this frame.
     * May return true multiple times per frame for catch-up.
     */
    bool shouldUpdate();

    /**
     * Gets the fixed delta time handed to PathAnimator/WalkerController
     * @return fixed timestep in seconds
     */
    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Call this at the end of each frame. Sleeps out the rest of the target frame time.
     */
    void endFrame() const;

private:
    float m_fixedTimestep;
    Uint64 m_targetFrameNs;

    Uint64 m_frameStartNs{0};
    Uint64 m_lastFrameNs{0};

    double m_accumulator{0.0};
    static constexpr double MAX_FRAME_DELTA = 0.25; // Clamp to prevent a catch-up spiral

    bool m_firstFrame{true};
};

} // namespace Wayfinder

#endif // TIMESTEP_MANAGER_HPP
