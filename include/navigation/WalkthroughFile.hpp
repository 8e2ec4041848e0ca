/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WALKTHROUGH_FILE_HPP
#define WALKTHROUGH_FILE_HPP

#include "utils/Bounds3D.hpp"
#include "utils/Vector3D.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Wayfinder {

class JsonValue;

/**
 * @brief Waypoints and selected-object bounds for one walkthrough
 */
struct WalkthroughScene {
    std::vector<Vector3D> waypoints;
    std::vector<Bounds3D> objects;
};

/**
 * @brief Loads a walkthrough description from JSON
 *
 * Format:
 *   {
 *     "waypoints": [[x, y, z], ...] or [{"x": .., "y": .., "z": ..}, ...],
 *     "objects":   [{"min": [x, y, z], "max": [x, y, z]}, ...]   (optional)
 *   }
 *
 * Waypoint count is not checked here; PathAnimator::setPath() decides
 * whether a path is usable.
 */
class WalkthroughFile {
public:
    WalkthroughFile() = default;

    bool loadFromFile(const std::string& path);
    bool parse(const std::string& json);

    const WalkthroughScene& getScene() const { return m_scene; }
    const std::string& getLastError() const { return m_lastError; }

private:
    WalkthroughScene m_scene;
    std::string m_lastError;

    bool readScene(const JsonValue& root);
    static std::optional<Vector3D> readPoint(const JsonValue& value);
};

} // namespace Wayfinder

#endif // WALKTHROUGH_FILE_HPP
