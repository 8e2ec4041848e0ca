/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include <SDL3/SDL.h>
#include <cstring>
#include <format>
#include <iostream>
#include <string>
#include "controllers/ICameraSink.hpp"
#include "controllers/WalkerController.hpp"
#include "core/Logger.hpp"
#include "core/TimestepManager.hpp"
#include "entities/IAgentVisual.hpp"
#include "managers/SettingsManager.hpp"
#include "navigation/FloorClusterer.hpp"
#include "navigation/WalkthroughFile.hpp"

using namespace Wayfinder;

const float FPS{60.0f};
const std::string DEFAULT_PATH_FILE{"res/demo_walkthrough.json"};
const std::string DEFAULT_SETTINGS_FILE{"res/settings.json"};
// Frames allowed beyond the expected traversal time before giving up
const int FRAME_SLACK{600};

namespace {

// Headless stand-ins for the scene graph: keep the last written values
class ConsoleAgentVisual : public IAgentVisual {
public:
    void setPosition(const Vector3D& position) override { m_position = position; }
    void setYaw(float yaw) override { m_yaw = yaw; }
    void setVisible(bool visible) override { m_visible = visible; }
    void applyGaitPose(const GaitPose& pose) override { m_pose = pose; }

    const Vector3D& position() const { return m_position; }
    float yaw() const { return m_yaw; }
    bool visible() const { return m_visible; }
    const GaitPose& pose() const { return m_pose; }

private:
    Vector3D m_position;
    float m_yaw{0.0f};
    bool m_visible{false};
    GaitPose m_pose{};
};

class ConsoleCamera : public ICameraSink, public IOrbitTarget {
public:
    void setPosition(const Vector3D& position) override { m_position = position; }
    void lookAt(const Vector3D& target) override { m_lookAt = target; }
    void setTarget(const Vector3D& target) override { m_orbitTarget = target; }

    const Vector3D& position() const { return m_position; }
    const Vector3D& orbitTarget() const { return m_orbitTarget; }

private:
    Vector3D m_position{0.0f, 5.0f, 10.0f};
    Vector3D m_lookAt;
    Vector3D m_orbitTarget;
};

std::string formatPoint(const Vector3D& p) {
    return std::format("({:.2f}, {:.2f}, {:.2f})", p.getX(), p.getY(), p.getZ());
}

void printFloors(const WalkthroughScene& scene, float gapThreshold) {
    if (scene.objects.empty()) {
        std::cout << "Wayfinder - No objects selected, skipping floor detection\n";
        return;
    }

    const Bounds3D bounds = FloorClusterer::combinedBounds(scene.objects);
    std::cout << "Wayfinder - Selection bounds: min " << formatPoint(bounds.min)
              << " max " << formatPoint(bounds.max) << "\n";

    const std::vector<float> floors = FloorClusterer::detectFloorLevels(scene.objects, gapThreshold);
    std::cout << "Wayfinder - Detected " << floors.size() << " floor level(s):";
    for (float floor : floors) {
        std::cout << std::format(" {:.3f}", floor);
    }
    std::cout << "\n";
}

} // namespace

// walkthrough_demo [path.json] [settings.json] [--fast]
// --fast steps the fixed timestep without real-time pacing.
int main(int argc, char* argv[]) {
    std::string pathFile = DEFAULT_PATH_FILE;
    std::string settingsFile = DEFAULT_SETTINGS_FILE;
    bool realTime = true;

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--fast") == 0) {
            realTime = false;
        } else if (positional == 0) {
            pathFile = argv[i];
            ++positional;
        } else if (positional == 1) {
            settingsFile = argv[i];
            ++positional;
        } else {
            std::cerr << "Wayfinder - Unexpected argument: " << argv[i] << "\n";
            return 2;
        }
    }

    std::cout << "Wayfinder - Initializing walkthrough demo...\n";

    if (!SDL_Init(0)) {
        DEMO_CRITICAL(std::format("SDL init failed: {}", SDL_GetError()));
        return -1;
    }

    auto& settings = SettingsManager::Instance();
    if (!settings.loadFromFile(settingsFile)) {
        DEMO_ERROR("Continuing with built-in defaults, settings not loaded: " + settingsFile);
    }

    WalkthroughFile walkthrough;
    if (!walkthrough.loadFromFile(pathFile)) {
        DEMO_CRITICAL("Failed to load walkthrough " + pathFile + ": " + walkthrough.getLastError());
        SDL_Quit();
        return 1;
    }
    const WalkthroughScene& scene = walkthrough.getScene();

    printFloors(scene, settings.get<float>("floors", "gap_threshold",
                                           FloorClusterer::DEFAULT_GAP_THRESHOLD));

    ConsoleAgentVisual visual;
    ConsoleCamera camera;
    WalkerController walker(visual, camera, camera);
    walker.setStatusCallback([](const std::string& status) {
        std::cout << "Wayfinder - " << status << "\n";
    });

    if (!walker.applySettings(settings)) {
        DEMO_ERROR("Some settings were rejected, defaults kept for those values");
    }

    if (walker.setPath(scene.waypoints) != PathAnimator::Result::Success) {
        DEMO_CRITICAL(std::format("Walkthrough {} has no usable path ({} waypoints)",
                                  pathFile, scene.waypoints.size()));
        SDL_Quit();
        return 1;
    }

    walker.syncCamera(camera.position(), camera.orbitTarget());
    if (walker.startOrResumeWalking() != PathAnimator::Result::Success) {
        SDL_Quit();
        return 1;
    }

    TimestepManager timestep(FPS, 1.0f / FPS);
    const PathAnimator& animator = walker.getAnimator();
    const float dt = timestep.getUpdateDeltaTime();
    const int maxFrames = static_cast<int>(animator.getTotalPathLength() / animator.getSpeed() / dt) + FRAME_SLACK;

    int frames = 0;
    while (!animator.isCompleted() && frames < maxFrames) {
        if (realTime) {
            timestep.startFrame();
            while (timestep.shouldUpdate() && !animator.isCompleted()) {
                walker.update(dt);
                ++frames;
            }
            timestep.endFrame();
        } else {
            walker.update(dt);
            ++frames;
        }
    }

    if (!animator.isCompleted()) {
        DEMO_ERROR(std::format("Walker did not finish within {} frames", maxFrames));
        SDL_Quit();
        return 1;
    }

    std::cout << std::format("Wayfinder - Arrived at {} after {} frames ({:.2f}s simulated), camera at {}\n",
                             formatPoint(visual.position()), frames, walker.getElapsedTime(),
                             formatPoint(camera.position()));

    std::cout << "Wayfinder - Walkthrough demo shutting down...\n";
    SDL_Quit();
    return 0;
}
