/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE PathAnimatorTests
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

#include "core/Logger.hpp"
#include "entities/PathAnimator.hpp"
#include "mocks/MockSinks.hpp"

using namespace Wayfinder;

constexpr float EPSILON = 0.001f;
constexpr float PI = 3.14159265f;

bool approxEqual(float a, float b, float epsilon = EPSILON) {
    return std::abs(a - b) < epsilon;
}

bool approxEqual(const Vector3D& a, const Vector3D& b, float epsilon = EPSILON) {
    return approxEqual(a.getX(), b.getX(), epsilon) &&
           approxEqual(a.getY(), b.getY(), epsilon) &&
           approxEqual(a.getZ(), b.getZ(), epsilon);
}

struct QuietLogs {
    QuietLogs() { WAYFINDER_ENABLE_QUIET_MODE(); }
    ~QuietLogs() { WAYFINDER_DISABLE_QUIET_MODE(); }
};
BOOST_TEST_GLOBAL_FIXTURE(QuietLogs);

// Animator plus recording sink and notification log
struct AnimatorFixture {
    MockAgentVisual visual;
    PathAnimator animator{visual};
    std::vector<std::pair<size_t, size_t>> progress;
    int completions{0};

    AnimatorFixture() {
        animator.setOnProgress([this](size_t index, size_t total) {
            progress.emplace_back(index, total);
        });
        animator.setOnComplete([this]() { ++completions; });
    }
};

const std::vector<Vector3D> STRAIGHT_PATH{{0.0f, 0.0f, 0.0f}, {10.0f, 0.0f, 0.0f}};
const std::vector<Vector3D> L_PATH{{0.0f, 0.0f, 0.0f}, {3.0f, 0.0f, 0.0f}, {3.0f, 0.0f, 4.0f}};

// ============================================================================
// PATH ACCEPTANCE
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SetPathTests, AnimatorFixture)

BOOST_AUTO_TEST_CASE(TestVisualHiddenUntilPathAccepted) {
    BOOST_CHECK(!visual.isVisible());
    BOOST_CHECK(!animator.isVisible());

    BOOST_CHECK_EQUAL(animator.setPath(STRAIGHT_PATH), PathAnimator::Result::Success);
    BOOST_CHECK(visual.isVisible());
    BOOST_CHECK(animator.isVisible());
}

BOOST_AUTO_TEST_CASE(TestSinglePointPathRejected) {
    BOOST_CHECK_EQUAL(animator.setPath({Vector3D(1.0f, 2.0f, 3.0f)}),
                      PathAnimator::Result::InvalidPath);
    BOOST_CHECK(!animator.hasPath());
    BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Idle);
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D()));
    BOOST_CHECK(!visual.isVisible());
    BOOST_CHECK(progress.empty());
}

BOOST_AUTO_TEST_CASE(TestRejectedPathKeepsPreviousState) {
    BOOST_REQUIRE_EQUAL(animator.setPath(L_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);
    animator.update(1.0f);

    const AgentState before = animator.getState();
    BOOST_CHECK_EQUAL(animator.setPath({Vector3D(5.0f, 5.0f, 5.0f)}),
                      PathAnimator::Result::InvalidPath);
    BOOST_CHECK_EQUAL(animator.setPath({}), PathAnimator::Result::InvalidPath);

    const AgentState& after = animator.getState();
    BOOST_CHECK_EQUAL(after.segmentIndex, before.segmentIndex);
    BOOST_CHECK_EQUAL(after.segmentProgress, before.segmentProgress);
    BOOST_CHECK_EQUAL(after.motionState, before.motionState);
    BOOST_CHECK(approxEqual(after.position, before.position));
    BOOST_CHECK_EQUAL(animator.getWaypointCount(), 3u);
}

BOOST_AUTO_TEST_CASE(TestNonFinitePathRejected) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    BOOST_CHECK_EQUAL(animator.setPath({Vector3D(0.0f, 0.0f, 0.0f), Vector3D(nan, 0.0f, 1.0f)}),
                      PathAnimator::Result::InvalidPath);
    BOOST_CHECK(!animator.hasPath());
}

BOOST_AUTO_TEST_CASE(TestSetPathSnapsToFirstWaypoint) {
    const std::vector<Vector3D> path{{2.0f, 1.0f, 2.0f}, {2.0f, 1.0f, 7.0f}};
    BOOST_REQUIRE_EQUAL(animator.setPath(path), PathAnimator::Result::Success);

    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), 0u);
    BOOST_CHECK_EQUAL(animator.getSegmentProgress(), 0.0f);
    BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Idle);
    BOOST_CHECK(approxEqual(animator.getPosition(), path[0]));
    BOOST_CHECK(approxEqual(visual.getPosition(), path[0]));
    // Facing +Z
    BOOST_CHECK(approxEqual(animator.getYaw(), 0.0f));
    BOOST_CHECK(animator.isAtStart());
}

BOOST_AUTO_TEST_CASE(TestPathIsCopied) {
    std::vector<Vector3D> path = STRAIGHT_PATH;
    BOOST_REQUIRE_EQUAL(animator.setPath(path), PathAnimator::Result::Success);
    path[1] = Vector3D(-50.0f, 0.0f, 0.0f);

    BOOST_CHECK(approxEqual(animator.getWaypoints()[1], Vector3D(10.0f, 0.0f, 0.0f)));
    BOOST_CHECK(approxEqual(animator.getTotalPathLength(), 10.0f));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TRAVERSAL
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TraversalTests, AnimatorFixture)

BOOST_AUTO_TEST_CASE(TestStraightPathCompletesAfterFiveSeconds) {
    BOOST_REQUIRE_EQUAL(animator.setPath(STRAIGHT_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE(animator.setSpeed(2.0f));
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);

    for (int i = 0; i < 4; ++i) {
        animator.update(1.0f);
        BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Walking);
    }
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(8.0f, 0.0f, 0.0f)));

    animator.update(1.0f);
    BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Completed);
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(10.0f, 0.0f, 0.0f)));
    BOOST_CHECK(approxEqual(visual.getPosition(), Vector3D(10.0f, 0.0f, 0.0f)));
    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), 0u);
    BOOST_CHECK_EQUAL(completions, 1);
}

BOOST_AUTO_TEST_CASE(TestCumulativeTimeMatchesPathLengthOverSpeed) {
    // Length 7 at speed 2: 3.5 seconds, 210 frames at 60 Hz
    BOOST_REQUIRE_EQUAL(animator.setPath(L_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);

    const float dt = 1.0f / 60.0f;
    for (int i = 0; i < 209; ++i) {
        animator.update(dt);
    }
    BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Walking);
    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), 1u);

    animator.update(dt);
    BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Completed);
    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), L_PATH.size() - 2);
    BOOST_CHECK(approxEqual(animator.getPosition(), L_PATH.back()));
}

BOOST_AUTO_TEST_CASE(TestLongSegmentsKeepPaceWithSmallSteps) {
    struct Case {
        float length;
        float speed;
        float dt;
        int expectedFrames;
    };
    const Case cases[] = {
        {1000.0f, 1.0f, 0.001f, 1000000},
        {2000.0f, 2.0f, 1.0f / 240.0f, 240000},
        {500.0f, 1.0f, 1.0f / 144.0f, 72000},
    };

    for (const Case& c : cases) {
        const std::vector<Vector3D> path{{0.0f, 0.0f, 0.0f}, {c.length, 0.0f, 0.0f}};
        BOOST_REQUIRE_EQUAL(animator.setPath(path), PathAnimator::Result::Success);
        BOOST_REQUIRE(animator.setSpeed(c.speed));
        BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);

        int frame = 0;
        while (!animator.isCompleted() && frame < c.expectedFrames + 10) {
            animator.update(c.dt);
            ++frame;
            if (frame == c.expectedFrames / 2) {
                BOOST_CHECK_MESSAGE(approxEqual(animator.getPosition().getX(), c.length / 2.0f, 0.01f),
                                    "halfway x = " << animator.getPosition().getX());
            }
        }

        BOOST_CHECK(animator.isCompleted());
        BOOST_CHECK_MESSAGE(std::abs(frame - c.expectedFrames) <= 1,
                            "completed at frame " << frame << " of " << c.expectedFrames);
        BOOST_CHECK(approxEqual(animator.getPosition(), path.back()));
    }
}

BOOST_AUTO_TEST_CASE(TestOvershootCarriesIntoNextSegment) {
    BOOST_REQUIRE_EQUAL(animator.setPath(L_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);

    // 4 units in one step: 3 along X, 1 along Z
    animator.update(2.0f);
    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), 1u);
    BOOST_CHECK(approxEqual(animator.getSegmentProgress(), 0.25f));
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(3.0f, 0.0f, 1.0f)));
    BOOST_CHECK(approxEqual(animator.getRemainingDistance(), 3.0f));

    // Remaining 3 units in uneven steps
    animator.update(0.7f);
    animator.update(0.8f);
    BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Completed);
    BOOST_CHECK(approxEqual(animator.getPosition(), L_PATH.back()));
}

BOOST_AUTO_TEST_CASE(TestProgressNotifications) {
    BOOST_REQUIRE_EQUAL(animator.setPath(L_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);

    BOOST_REQUIRE_EQUAL(progress.size(), 1u);
    BOOST_CHECK_EQUAL(progress[0].first, 0u);
    BOOST_CHECK_EQUAL(progress[0].second, 3u);

    animator.update(1.6f);  // past waypoint 1
    BOOST_REQUIRE_EQUAL(progress.size(), 2u);
    BOOST_CHECK_EQUAL(progress[1].first, 1u);

    animator.update(2.0f);  // past the end
    BOOST_REQUIRE_EQUAL(progress.size(), 3u);
    BOOST_CHECK_EQUAL(progress[2].first, 2u);
    BOOST_CHECK_EQUAL(progress[2].second, 3u);
    BOOST_CHECK_EQUAL(completions, 1);
}

BOOST_AUTO_TEST_CASE(TestCompletionFiresOnce) {
    BOOST_REQUIRE_EQUAL(animator.setPath(STRAIGHT_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);

    for (int i = 0; i < 20; ++i) {
        animator.update(1.0f);
    }
    BOOST_CHECK_EQUAL(completions, 1);
    BOOST_CHECK(animator.isCompleted());
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(10.0f, 0.0f, 0.0f)));
    BOOST_CHECK_EQUAL(animator.getRemainingDistance(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestDegenerateSegmentSkipped) {
    const std::vector<Vector3D> path{{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 2.0f}};
    BOOST_REQUIRE_EQUAL(animator.setPath(path), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);

    animator.update(0.5f);
    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), 1u);
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(0.0f, 0.0f, 1.0f)));
    BOOST_CHECK(std::isfinite(animator.getSegmentProgress()));
}

BOOST_AUTO_TEST_CASE(TestUpdateIgnoredUnlessWalking) {
    BOOST_REQUIRE_EQUAL(animator.setPath(STRAIGHT_PATH), PathAnimator::Result::Success);
    animator.update(1.0f);
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(0.0f, 0.0f, 0.0f)));
    BOOST_CHECK(animator.isAtStart());
}

BOOST_AUTO_TEST_CASE(TestInvalidDeltaTimeIgnored) {
    BOOST_REQUIRE_EQUAL(animator.setPath(STRAIGHT_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);

    animator.update(-1.0f);
    animator.update(std::numeric_limits<float>::quiet_NaN());
    BOOST_CHECK_EQUAL(animator.getSegmentProgress(), 0.0f);
    BOOST_CHECK(animator.isWalking());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CONTROL OPERATIONS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ControlTests, AnimatorFixture)

BOOST_AUTO_TEST_CASE(TestStartWithoutPathRejected) {
    BOOST_CHECK_EQUAL(animator.start(), PathAnimator::Result::InvalidPath);
    BOOST_CHECK_EQUAL(animator.resume(), PathAnimator::Result::InvalidPath);
    BOOST_CHECK_EQUAL(animator.resetPosition(), PathAnimator::Result::InvalidPath);
    BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Idle);
}

BOOST_AUTO_TEST_CASE(TestStopIsIdempotent) {
    BOOST_REQUIRE_EQUAL(animator.setPath(L_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);
    animator.update(0.5f);

    animator.stop();
    const AgentState once = animator.getState();
    animator.stop();
    const AgentState& twice = animator.getState();

    BOOST_CHECK_EQUAL(twice.motionState, MotionState::Idle);
    BOOST_CHECK_EQUAL(twice.motionState, once.motionState);
    BOOST_CHECK_EQUAL(twice.segmentIndex, once.segmentIndex);
    BOOST_CHECK_EQUAL(twice.segmentProgress, once.segmentProgress);
    BOOST_CHECK(approxEqual(twice.position, once.position));
}

BOOST_AUTO_TEST_CASE(TestStopKeepsProgressAndResumeContinues) {
    BOOST_REQUIRE_EQUAL(animator.setPath(STRAIGHT_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);
    animator.update(1.0f);
    animator.stop();

    animator.update(1.0f);
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(2.0f, 0.0f, 0.0f)));

    BOOST_CHECK_EQUAL(animator.resume(), PathAnimator::Result::Success);
    animator.update(1.0f);
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(4.0f, 0.0f, 0.0f)));
}

BOOST_AUTO_TEST_CASE(TestStartMidPathBehavesAsResume) {
    BOOST_REQUIRE_EQUAL(animator.setPath(STRAIGHT_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);
    animator.update(1.0f);
    animator.stop();
    progress.clear();

    BOOST_CHECK(!animator.isAtStart());
    BOOST_CHECK_EQUAL(animator.start(), PathAnimator::Result::Success);
    BOOST_CHECK(animator.isWalking());
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(2.0f, 0.0f, 0.0f)));
    BOOST_CHECK(progress.empty());
}

BOOST_AUTO_TEST_CASE(TestCompletedTraversalNeedsReset) {
    BOOST_REQUIRE_EQUAL(animator.setPath(STRAIGHT_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);
    animator.update(10.0f);
    BOOST_REQUIRE(animator.isCompleted());

    BOOST_CHECK_EQUAL(animator.start(), PathAnimator::Result::TraversalCompleted);
    BOOST_CHECK_EQUAL(animator.resume(), PathAnimator::Result::TraversalCompleted);
    BOOST_CHECK(animator.isCompleted());

    BOOST_CHECK_EQUAL(animator.resetPosition(), PathAnimator::Result::Success);
    BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Idle);
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(0.0f, 0.0f, 0.0f)));
    BOOST_CHECK(animator.isAtStart());

    BOOST_CHECK_EQUAL(animator.start(), PathAnimator::Result::Success);
    animator.update(10.0f);
    BOOST_CHECK_EQUAL(completions, 2);
}

BOOST_AUTO_TEST_CASE(TestResetPositionDoesNotStart) {
    BOOST_REQUIRE_EQUAL(animator.setPath(L_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);
    animator.update(2.0f);

    BOOST_CHECK_EQUAL(animator.resetPosition(), PathAnimator::Result::Success);
    BOOST_CHECK_EQUAL(animator.getMotionState(), MotionState::Idle);
    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), 0u);
    BOOST_CHECK_EQUAL(animator.getSegmentProgress(), 0.0f);
    BOOST_CHECK(approxEqual(animator.getPosition(), L_PATH[0]));
    // Facing +X again
    BOOST_CHECK(approxEqual(animator.getYaw(), PI / 2.0f));
}

BOOST_AUTO_TEST_CASE(TestHideStopsWalking) {
    BOOST_REQUIRE_EQUAL(animator.setPath(STRAIGHT_PATH), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);

    animator.hide();
    BOOST_CHECK(!visual.isVisible());
    BOOST_CHECK(!animator.isWalking());

    animator.update(1.0f);
    BOOST_CHECK(approxEqual(animator.getPosition(), Vector3D(0.0f, 0.0f, 0.0f)));

    animator.show();
    BOOST_CHECK(visual.isVisible());
    BOOST_CHECK(!animator.isWalking());
}

BOOST_AUTO_TEST_CASE(TestSpeedClampedToMinimum) {
    BOOST_CHECK(animator.setSpeed(0.01f));
    BOOST_CHECK_EQUAL(animator.getSpeed(), PathAnimator::MIN_SPEED);

    BOOST_CHECK(animator.setSpeed(-3.0f));
    BOOST_CHECK_EQUAL(animator.getSpeed(), PathAnimator::MIN_SPEED);

    BOOST_CHECK(animator.setSpeed(3.5f));
    BOOST_CHECK_EQUAL(animator.getSpeed(), 3.5f);

    BOOST_CHECK(!animator.setSpeed(std::numeric_limits<float>::infinity()));
    BOOST_CHECK_EQUAL(animator.getSpeed(), 3.5f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ORIENTATION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(YawTests, AnimatorFixture)

BOOST_AUTO_TEST_CASE(TestYawFollowsSegments) {
    BOOST_REQUIRE_EQUAL(animator.setPath(L_PATH), PathAnimator::Result::Success);
    BOOST_CHECK(approxEqual(animator.getYaw(), PI / 2.0f));
    BOOST_CHECK(approxEqual(visual.getYaw(), PI / 2.0f));

    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);
    animator.update(1.6f);
    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), 1u);
    BOOST_CHECK(approxEqual(animator.getYaw(), 0.0f));
}

BOOST_AUTO_TEST_CASE(TestVerticalSegmentKeepsYaw) {
    const std::vector<Vector3D> path{
        {0.0f, 0.0f, 0.0f}, {5.0f, 0.0f, 0.0f}, {5.0f, 3.0f, 0.0f}, {5.0f, 3.0f, -4.0f}};
    BOOST_REQUIRE_EQUAL(animator.setPath(path), PathAnimator::Result::Success);
    BOOST_REQUIRE_EQUAL(animator.start(), PathAnimator::Result::Success);
    const float initialYaw = animator.getYaw();
    BOOST_CHECK(approxEqual(initialYaw, PI / 2.0f));

    // Onto the stair segment
    animator.update(3.0f);
    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), 1u);
    BOOST_CHECK_EQUAL(animator.getYaw(), initialYaw);
    BOOST_CHECK(std::isfinite(animator.getYaw()));

    // Onto the final segment, heading -Z
    animator.update(1.5f);
    BOOST_CHECK_EQUAL(animator.getSegmentIndex(), 2u);
    BOOST_CHECK(approxEqual(std::abs(animator.getYaw()), PI));
}

BOOST_AUTO_TEST_SUITE_END()
