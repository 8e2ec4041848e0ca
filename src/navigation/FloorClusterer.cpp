/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "navigation/FloorClusterer.hpp"
#include "core/Logger.hpp"
#include <boost/container/flat_map.hpp>
#include <cmath>
#include <cstdint>
#include <format>

namespace Wayfinder {

namespace {

// Raw samples that round to the same tenth share one bucket
struct ElevationBucket {
    double sum{0.0};
    size_t count{0};
};

// One decimal place; half rounds toward +infinity
int64_t toTenths(float value) {
    return static_cast<int64_t>(std::floor(static_cast<double>(value) * 10.0 + 0.5));
}

} // namespace

std::vector<float> FloorClusterer::clusterFloorLevels(const std::vector<float>& samples,
                                                      float gapThreshold) {
    std::vector<float> floors;
    if (!std::isfinite(gapThreshold) || gapThreshold <= 0.0f) {
        FLOORS_WARN(std::format("Invalid gap threshold {}, no floors produced", gapThreshold));
        return floors;
    }
    if (samples.empty()) {
        return floors;
    }

    // Sorted, deduplicated by rounded key
    boost::container::flat_map<int64_t, ElevationBucket> buckets;
    buckets.reserve(samples.size());
    for (float sample : samples) {
        if (!std::isfinite(sample)) {
            FLOORS_WARN("Skipping non-finite elevation sample");
            continue;
        }
        ElevationBucket& bucket = buckets[toTenths(sample)];
        bucket.sum += sample;
        ++bucket.count;
    }
    if (buckets.empty()) {
        return floors;
    }

    double groupSum = 0.0;
    size_t groupCount = 0;
    int64_t lastInGroup = buckets.begin()->first;

    for (const auto& [tenths, bucket] : buckets) {
        const double gap = static_cast<double>(tenths - lastInGroup) / 10.0;
        if (groupCount > 0 && gap >= static_cast<double>(gapThreshold)) {
            floors.push_back(static_cast<float>(groupSum / static_cast<double>(groupCount)));
            groupSum = 0.0;
            groupCount = 0;
        }
        groupSum += bucket.sum;
        groupCount += bucket.count;
        lastInGroup = tenths;
    }
    floors.push_back(static_cast<float>(groupSum / static_cast<double>(groupCount)));

    FLOORS_DEBUG(std::format("Clustered {} samples into {} floor(s)", samples.size(), floors.size()));
    return floors;
}

std::vector<float> FloorClusterer::collectElevationSamples(const std::vector<Bounds3D>& objectBounds) {
    std::vector<float> samples;
    samples.reserve(objectBounds.size() * 2);
    for (const auto& bounds : objectBounds) {
        if (bounds.isEmpty()) {
            continue;
        }
        samples.push_back(bounds.min.getY());
        samples.push_back(bounds.max.getY());
    }
    return samples;
}

std::vector<float> FloorClusterer::detectFloorLevels(const std::vector<Bounds3D>& objectBounds,
                                                     float gapThreshold) {
    if (objectBounds.empty()) {
        return {};
    }
    std::vector<float> floors = clusterFloorLevels(collectElevationSamples(objectBounds), gapThreshold);
    FLOORS_INFO(std::format("Detected {} floor level(s) from {} object(s)", floors.size(), objectBounds.size()));
    return floors;
}

Bounds3D FloorClusterer::combinedBounds(const std::vector<Bounds3D>& objectBounds) {
    Bounds3D combined;
    for (const auto& bounds : objectBounds) {
        combined.expandByBounds(bounds);
    }
    return combined;
}

} // namespace Wayfinder
