/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE GaitSynthesizerTests
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <vector>

#include "core/Logger.hpp"
#include "entities/GaitSynthesizer.hpp"

using namespace Wayfinder;

constexpr float EPSILON = 0.0001f;

bool approxEqual(float a, float b, float epsilon = EPSILON) {
    return std::abs(a - b) < epsilon;
}

bool samePose(const GaitPose& a, const GaitPose& b) {
    return a.bodyLift == b.bodyLift && a.headLift == b.headLift &&
           a.leftArmAngle == b.leftArmAngle && a.rightArmAngle == b.rightArmAngle &&
           a.leftLegAngle == b.leftLegAngle && a.rightLegAngle == b.rightLegAngle;
}

struct QuietLogs {
    QuietLogs() { WAYFINDER_ENABLE_QUIET_MODE(); }
    ~QuietLogs() { WAYFINDER_DISABLE_QUIET_MODE(); }
};
BOOST_TEST_GLOBAL_FIXTURE(QuietLogs);

BOOST_AUTO_TEST_SUITE(WalkingPoseTests)

BOOST_AUTO_TEST_CASE(TestPhaseFormula) {
    GaitSynthesizer gait;
    // 1.5 * 5 * 2 * (1/60) * 60 = 15
    BOOST_CHECK(approxEqual(gait.walkPhase(1.5f, 1.0f / 60.0f, 2.0f), 15.0f, 0.001f));
}

BOOST_AUTO_TEST_CASE(TestWalkingPoseValues) {
    GaitSynthesizer gait;
    const float elapsed = 0.37f;
    const float dt = 1.0f / 60.0f;
    const float speed = 2.0f;
    const float s = std::sin(gait.walkPhase(elapsed, dt, speed));

    const GaitPose pose = gait.synthesize(MotionState::Walking, elapsed, dt, speed);
    BOOST_CHECK(approxEqual(pose.bodyLift, 0.3f + std::abs(s) * 0.02f));
    BOOST_CHECK(approxEqual(pose.headLift, 0.75f + std::abs(s) * 0.02f));
    BOOST_CHECK(approxEqual(pose.leftArmAngle, 0.5f * s));
    BOOST_CHECK(approxEqual(pose.leftLegAngle, 0.3f * s));
}

BOOST_AUTO_TEST_CASE(TestLimbsSwingInAntiphase) {
    GaitSynthesizer gait;
    for (int frame = 1; frame <= 120; ++frame) {
        const GaitPose pose = gait.walkingPose(frame / 60.0f, 1.0f / 60.0f, 2.0f);
        BOOST_CHECK_EQUAL(pose.leftArmAngle, -pose.rightArmAngle);
        BOOST_CHECK_EQUAL(pose.leftLegAngle, -pose.rightLegAngle);
        BOOST_CHECK(std::abs(pose.leftArmAngle) <= 0.5f + EPSILON);
        BOOST_CHECK(std::abs(pose.leftLegAngle) <= 0.3f + EPSILON);
        BOOST_CHECK(pose.bodyLift >= 0.3f - EPSILON);
        BOOST_CHECK(pose.bodyLift <= 0.32f + EPSILON);
    }
}

BOOST_AUTO_TEST_CASE(TestDeterministicForSameInput) {
    GaitSynthesizer first;
    GaitSynthesizer second;

    std::vector<GaitPose> a;
    std::vector<GaitPose> b;
    float elapsedA = 0.0f;
    float elapsedB = 0.0f;
    for (int frame = 0; frame < 90; ++frame) {
        const float dt = (frame % 3 == 0) ? 0.02f : 0.015f;
        elapsedA += dt;
        elapsedB += dt;
        a.push_back(first.synthesize(MotionState::Walking, elapsedA, dt, 2.0f));
        b.push_back(second.synthesize(MotionState::Walking, elapsedB, dt, 2.0f));
    }

    for (size_t i = 0; i < a.size(); ++i) {
        BOOST_CHECK(samePose(a[i], b[i]));
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(IdlePoseTests)

BOOST_AUTO_TEST_CASE(TestIdleLimbsNeutral) {
    GaitSynthesizer gait;
    for (MotionState state : {MotionState::Idle, MotionState::Completed}) {
        const GaitPose pose = gait.synthesize(state, 2.0f, 1.0f / 60.0f, 2.0f);
        BOOST_CHECK_EQUAL(pose.leftArmAngle, 0.0f);
        BOOST_CHECK_EQUAL(pose.rightArmAngle, 0.0f);
        BOOST_CHECK_EQUAL(pose.leftLegAngle, 0.0f);
        BOOST_CHECK_EQUAL(pose.rightLegAngle, 0.0f);
        BOOST_CHECK(approxEqual(pose.bodyLift, 0.3f + std::sin(2.0f) * 0.01f));
        BOOST_CHECK(approxEqual(pose.headLift, 0.75f + std::sin(2.0f) * 0.01f));
    }
}

BOOST_AUTO_TEST_CASE(TestIdleBobSmallerThanWalkingBob) {
    GaitSynthesizer gait;
    float maxIdle = 0.0f;
    float maxWalk = 0.0f;
    for (int frame = 1; frame <= 600; ++frame) {
        const float t = frame / 60.0f;
        maxIdle = std::max(maxIdle, std::abs(gait.idlePose(t).bodyLift - 0.3f));
        maxWalk = std::max(maxWalk, gait.walkingPose(t, 1.0f / 60.0f, 2.0f).bodyLift - 0.3f);
    }
    BOOST_CHECK(maxIdle <= 0.01f + EPSILON);
    BOOST_CHECK(maxIdle < maxWalk);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ConfigTests)

BOOST_AUTO_TEST_CASE(TestDefaultConfigValid) {
    GaitSynthesizer::Config config;
    BOOST_CHECK(config.isValid());
}

BOOST_AUTO_TEST_CASE(TestIdleAmplitudeMustStayBelowWalk) {
    GaitSynthesizer gait;
    GaitSynthesizer::Config config;
    config.idleBobAmplitude = 0.05f;

    BOOST_CHECK(!config.isValid());
    BOOST_CHECK(!gait.setConfig(config));
    BOOST_CHECK_EQUAL(gait.getConfig().idleBobAmplitude, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestCustomConfigApplied) {
    GaitSynthesizer::Config config;
    config.baseBodyHeight = 1.0f;
    config.armSwingAmplitude = 0.8f;

    GaitSynthesizer gait(config);
    const float s = std::sin(gait.walkPhase(0.5f, 0.02f, 1.0f));
    const GaitPose pose = gait.walkingPose(0.5f, 0.02f, 1.0f);
    BOOST_CHECK(approxEqual(pose.bodyLift, 1.0f + std::abs(s) * 0.02f));
    BOOST_CHECK(approxEqual(pose.leftArmAngle, 0.8f * s));
}

BOOST_AUTO_TEST_CASE(TestInvalidConstructorConfigFallsBack) {
    GaitSynthesizer::Config config;
    config.walkCycleRate = -1.0f;

    GaitSynthesizer gait(config);
    BOOST_CHECK_EQUAL(gait.getConfig().walkCycleRate, 5.0f);
}

BOOST_AUTO_TEST_SUITE_END()
