/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "navigation/WalkthroughFile.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>
#include <utility>

namespace Wayfinder {

bool WalkthroughFile::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        m_lastError = reader.getLastError();
        return false;
    }
    return readScene(reader.getRoot());
}

bool WalkthroughFile::parse(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        m_lastError = reader.getLastError();
        return false;
    }
    return readScene(reader.getRoot());
}

bool WalkthroughFile::readScene(const JsonValue& root) {
    if (!root.isObject()) {
        m_lastError = "Walkthrough root must be a JSON object";
        return false;
    }

    const JsonArray* waypoints = root["waypoints"].tryAsArray();
    if (!waypoints) {
        m_lastError = "Missing \"waypoints\" array";
        return false;
    }

    WalkthroughScene scene;
    scene.waypoints.reserve(waypoints->size());
    for (size_t i = 0; i < waypoints->size(); ++i) {
        auto point = readPoint((*waypoints)[i]);
        if (!point) {
            m_lastError = std::format("Waypoint {} is not a finite [x, y, z] point", i);
            return false;
        }
        scene.waypoints.push_back(*point);
    }

    const JsonValue& objects = root["objects"];
    if (!objects.isNull()) {
        const JsonArray* objectArray = objects.tryAsArray();
        if (!objectArray) {
            m_lastError = "\"objects\" must be an array";
            return false;
        }
        scene.objects.reserve(objectArray->size());
        for (size_t i = 0; i < objectArray->size(); ++i) {
            const JsonValue& object = (*objectArray)[i];
            auto minCorner = readPoint(object["min"]);
            auto maxCorner = readPoint(object["max"]);
            if (!minCorner || !maxCorner) {
                m_lastError = std::format("Object {} needs finite \"min\" and \"max\" points", i);
                return false;
            }
            scene.objects.emplace_back(*minCorner, *maxCorner);
        }
    }

    m_scene = std::move(scene);
    m_lastError.clear();
    JSON_DEBUG(std::format("Walkthrough loaded: {} waypoints, {} objects",
                           m_scene.waypoints.size(), m_scene.objects.size()));
    return true;
}

std::optional<Vector3D> WalkthroughFile::readPoint(const JsonValue& value) {
    std::optional<float> x, y, z;
    if (value.isArray()) {
        if (value.size() != 3) {
            return std::nullopt;
        }
        x = value[0].tryAsFloat();
        y = value[1].tryAsFloat();
        z = value[2].tryAsFloat();
    } else if (value.isObject()) {
        x = value["x"].tryAsFloat();
        y = value["y"].tryAsFloat();
        z = value["z"].tryAsFloat();
    }

    if (!x || !y || !z) {
        return std::nullopt;
    }
    Vector3D point(*x, *y, *z);
    if (!point.isFinite()) {
        return std::nullopt;
    }
    return point;
}

} // namespace Wayfinder
