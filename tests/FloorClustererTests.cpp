/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE FloorClustererTests
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <vector>

#include "core/Logger.hpp"
#include "navigation/FloorClusterer.hpp"

using namespace Wayfinder;

constexpr float EPSILON = 0.0001f;

bool approxEqual(float a, float b, float epsilon = EPSILON) {
    return std::abs(a - b) < epsilon;
}

struct QuietLogs {
    QuietLogs() { WAYFINDER_ENABLE_QUIET_MODE(); }
    ~QuietLogs() { WAYFINDER_DISABLE_QUIET_MODE(); }
};
BOOST_TEST_GLOBAL_FIXTURE(QuietLogs);

BOOST_AUTO_TEST_SUITE(ClusteringTests)

BOOST_AUTO_TEST_CASE(TestTwoFloors) {
    const std::vector<float> floors = FloorClusterer::clusterFloorLevels({0.0f, 0.05f, 3.0f, 3.02f}, 0.5f);
    BOOST_REQUIRE_EQUAL(floors.size(), 2u);
    BOOST_CHECK(approxEqual(floors[0], 0.025f));
    BOOST_CHECK(approxEqual(floors[1], 3.01f));
}

BOOST_AUTO_TEST_CASE(TestInputOrderIrrelevant) {
    const std::vector<float> floors = FloorClusterer::clusterFloorLevels({3.02f, 0.05f, 3.0f, 0.0f});
    BOOST_REQUIRE_EQUAL(floors.size(), 2u);
    BOOST_CHECK(approxEqual(floors[0], 0.025f));
    BOOST_CHECK(approxEqual(floors[1], 3.01f));
}

BOOST_AUTO_TEST_CASE(TestEmptyInput) {
    BOOST_CHECK(FloorClusterer::clusterFloorLevels({}).empty());
}

BOOST_AUTO_TEST_CASE(TestSingleSample) {
    const std::vector<float> floors = FloorClusterer::clusterFloorLevels({2.7f});
    BOOST_REQUIRE_EQUAL(floors.size(), 1u);
    BOOST_CHECK(approxEqual(floors[0], 2.7f));
}

BOOST_AUTO_TEST_CASE(TestCloseSamplesFormOneFloor) {
    // Consecutive gaps stay below the threshold even though the span exceeds it
    const std::vector<float> floors = FloorClusterer::clusterFloorLevels({1.0f, 1.3f, 1.6f, 1.9f});
    BOOST_REQUIRE_EQUAL(floors.size(), 1u);
    BOOST_CHECK(approxEqual(floors[0], 1.45f));
}

BOOST_AUTO_TEST_CASE(TestGapEqualToThresholdSplits) {
    const std::vector<float> floors = FloorClusterer::clusterFloorLevels({0.0f, 0.5f}, 0.5f);
    BOOST_CHECK_EQUAL(floors.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestThreeLevelsAscending) {
    const std::vector<float> floors =
        FloorClusterer::clusterFloorLevels({6.1f, -0.02f, 3.0f, 6.0f, 0.02f, 3.1f});
    BOOST_REQUIRE_EQUAL(floors.size(), 3u);
    BOOST_CHECK(approxEqual(floors[0], 0.0f));
    BOOST_CHECK(approxEqual(floors[1], 3.05f));
    BOOST_CHECK(approxEqual(floors[2], 6.05f));
}

BOOST_AUTO_TEST_CASE(TestNonFiniteSamplesSkipped) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    const std::vector<float> floors = FloorClusterer::clusterFloorLevels({nan, 1.0f, inf, 1.1f});
    BOOST_REQUIRE_EQUAL(floors.size(), 1u);
    BOOST_CHECK(approxEqual(floors[0], 1.05f));
}

BOOST_AUTO_TEST_CASE(TestInvalidThresholdRejected) {
    BOOST_CHECK(FloorClusterer::clusterFloorLevels({0.0f, 3.0f}, 0.0f).empty());
    BOOST_CHECK(FloorClusterer::clusterFloorLevels({0.0f, 3.0f}, -1.0f).empty());
    BOOST_CHECK(FloorClusterer::clusterFloorLevels({0.0f, 3.0f},
                                                   std::numeric_limits<float>::quiet_NaN()).empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BoundsTests)

BOOST_AUTO_TEST_CASE(TestElevationSamplesFromBounds) {
    const std::vector<Bounds3D> objects{
        Bounds3D(Vector3D(0.0f, 0.0f, 0.0f), Vector3D(1.0f, 0.05f, 1.0f)),
        Bounds3D(),  // empty, contributes nothing
        Bounds3D(Vector3D(0.0f, 3.0f, 0.0f), Vector3D(1.0f, 3.02f, 1.0f))};

    const std::vector<float> samples = FloorClusterer::collectElevationSamples(objects);
    BOOST_REQUIRE_EQUAL(samples.size(), 4u);
    BOOST_CHECK_EQUAL(samples[0], 0.0f);
    BOOST_CHECK_EQUAL(samples[1], 0.05f);

    const std::vector<float> floors = FloorClusterer::detectFloorLevels(objects);
    BOOST_REQUIRE_EQUAL(floors.size(), 2u);
    BOOST_CHECK(approxEqual(floors[0], 0.025f));
    BOOST_CHECK(approxEqual(floors[1], 3.01f));
}

BOOST_AUTO_TEST_CASE(TestNoObjectsNoFloors) {
    BOOST_CHECK(FloorClusterer::detectFloorLevels({}).empty());
    BOOST_CHECK(FloorClusterer::combinedBounds({}).isEmpty());
}

BOOST_AUTO_TEST_CASE(TestCombinedBounds) {
    const std::vector<Bounds3D> objects{
        Bounds3D(Vector3D(-1.0f, 0.0f, 2.0f), Vector3D(1.0f, 1.0f, 3.0f)),
        Bounds3D(Vector3D(0.0f, -2.0f, -4.0f), Vector3D(5.0f, 0.5f, 0.0f))};

    const Bounds3D combined = FloorClusterer::combinedBounds(objects);
    BOOST_CHECK(!combined.isEmpty());
    BOOST_CHECK(combined.min == Vector3D(-1.0f, -2.0f, -4.0f));
    BOOST_CHECK(combined.max == Vector3D(5.0f, 1.0f, 3.0f));
    BOOST_CHECK(combined.contains(Vector3D(4.0f, 0.0f, 2.5f)));
    BOOST_CHECK(!combined.contains(Vector3D(6.0f, 0.0f, 0.0f)));
}

BOOST_AUTO_TEST_SUITE_END()
