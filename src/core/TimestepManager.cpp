/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace Wayfinder {

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : 1.0f / 60.0f)
    , m_targetFrameNs(static_cast<Uint64>(SDL_NS_PER_SECOND /
                                          static_cast<double>(targetFPS > 0.0f ? targetFPS : 60.0f)))
{
    if (targetFPS <= 0.0f || fixedTimestep <= 0.0f) {
        TIMESTEP_WARN(std::format("Invalid timing ({} fps, {}s step), using defaults",
                                  targetFPS, fixedTimestep));
    }
}

void TimestepManager::startFrame() {
    const Uint64 now = SDL_GetTicksNS();

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameNs = now;
        m_frameStartNs = now;
        // Prime one update so the first frame advances the animation
        m_accumulator = m_fixedTimestep;
        return;
    }

    const double deltaSeconds = static_cast<double>(now - m_lastFrameNs) / SDL_NS_PER_SECOND;
    m_lastFrameNs = now;
    m_frameStartNs = now;

    if (deltaSeconds > MAX_FRAME_DELTA) {
        TIMESTEP_DEBUG(std::format("Frame took {:.3f}s, clamping to {:.2f}s",
                                   deltaSeconds, MAX_FRAME_DELTA));
    }
    m_accumulator += std::min(deltaSeconds, MAX_FRAME_DELTA);
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

void TimestepManager::endFrame() const {
    const Uint64 targetEndNs = m_frameStartNs + m_targetFrameNs;
    const Uint64 now = SDL_GetTicksNS();

    if (now < targetEndNs) {
        SDL_DelayPrecise(targetEndNs - now);
    }
}

} // namespace Wayfinder
