/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOOR_CLUSTERER_HPP
#define FLOOR_CLUSTERER_HPP

#include "utils/Bounds3D.hpp"
#include <vector>

namespace Wayfinder {

/**
 * @brief Groups raw elevation samples into discrete building levels
 *
 * Samples are bucketed by their value rounded to one decimal place. Buckets
 * are scanned in ascending order and a new level starts whenever the gap to
 * the previous bucket reaches the threshold. Each level is reported as the
 * mean of the raw samples that fell into it.
 */
class FloorClusterer {
public:
    static constexpr float DEFAULT_GAP_THRESHOLD{0.5f};

    /**
     * @brief Clusters elevation samples into ascending floor heights
     * @param samples Raw Y values, any order, duplicates allowed
     * @param gapThreshold Minimum gap between rounded samples that separates two floors
     * @return Representative floor elevations, ascending. Empty for empty input
     *         or an invalid threshold.
     */
    static std::vector<float> clusterFloorLevels(const std::vector<float>& samples,
                                                 float gapThreshold = DEFAULT_GAP_THRESHOLD);

    /**
     * @brief Emits min.y and max.y of every non-empty bounding volume
     */
    static std::vector<float> collectElevationSamples(const std::vector<Bounds3D>& objectBounds);

    /**
     * @brief collectElevationSamples() followed by clusterFloorLevels()
     */
    static std::vector<float> detectFloorLevels(const std::vector<Bounds3D>& objectBounds,
                                                float gapThreshold = DEFAULT_GAP_THRESHOLD);

    /**
     * @brief Union of all bounding volumes (empty box for empty input)
     */
    static Bounds3D combinedBounds(const std::vector<Bounds3D>& objectBounds);
};

} // namespace Wayfinder

#endif // FLOOR_CLUSTERER_HPP
