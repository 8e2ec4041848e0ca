/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAIT_SYNTHESIZER_HPP
#define GAIT_SYNTHESIZER_HPP

#include "entities/AgentState.hpp"

namespace Wayfinder {

/**
 * @brief Body and limb offsets for the walker's visual rig
 *
 * Lifts are heights in world units relative to the agent root; angles are
 * radians about the limb's local X axis.
 */
struct GaitPose {
    float bodyLift{0.0f};
    float headLift{0.0f};
    float leftArmAngle{0.0f};
    float rightArmAngle{0.0f};
    float leftLegAngle{0.0f};
    float rightLegAngle{0.0f};
};

/**
 * @brief Procedural walk/idle animation
 *
 * Stateless: the same (state, elapsedTime, deltaTime, walkSpeed) input always
 * yields the same pose. The caller owns the cumulative clock, so replaying a
 * frame sequence reproduces the animation exactly.
 */
class GaitSynthesizer {
public:
    struct Config {
        float baseBodyHeight{0.3f};
        float baseHeadHeight{0.75f};
        float walkBobAmplitude{0.02f};
        float armSwingAmplitude{0.5f};    // radians
        float legSwingAmplitude{0.3f};    // radians
        float idleBobAmplitude{0.01f};    // must stay below walkBobAmplitude
        float walkCycleRate{5.0f};        // phase units per second of elapsed time
        float referenceFrameRate{60.0f};  // deltaTime normalisation

        bool isValid() const;
    };

    GaitSynthesizer() = default;
    explicit GaitSynthesizer(const Config& config);

    /**
     * @brief Computes the pose for one frame
     * @param state Current motion state; anything but Walking yields the idle pose
     * @param elapsedTime Cumulative time in seconds supplied by the caller
     * @param deltaTime Duration of the current frame in seconds
     * @param walkSpeed Agent speed in units per second
     */
    GaitPose synthesize(MotionState state, float elapsedTime, float deltaTime,
                        float walkSpeed) const;

    GaitPose walkingPose(float elapsedTime, float deltaTime, float walkSpeed) const;
    GaitPose idlePose(float elapsedTime) const;

    /**
     * @brief Oscillation phase used by the walk cycle
     */
    float walkPhase(float elapsedTime, float deltaTime, float walkSpeed) const;

    /**
     * @brief Replaces the configuration
     * @return false (keeping the current one) if config fails validation
     */
    bool setConfig(const Config& config);
    const Config& getConfig() const { return m_config; }

private:
    Config m_config{};
};

} // namespace Wayfinder

#endif // GAIT_SYNTHESIZER_HPP
