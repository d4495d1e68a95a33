#pragma once

#include <chrono>
#include <memory>
#include <SDL.h>
#include "core/lighting_config.hpp"
#include "discovery/discovery_tracker.hpp"
#include "lighting/lighting_snapshot.hpp"
#include "render/light_compositor.hpp"
#include "utils/frame_throttle.hpp"

/*
  per view owner of the lighting pipeline
  the newest snapshot drives both the throttled compositor and discovery
*/

class LightingScene {

	public:
    using clock = std::chrono::steady_clock;

    LightingScene(const LightingConfig& config, int viewport_w, int viewport_h, bool start_discovery_thread = true);
    ~LightingScene();

    void set_snapshot(std::shared_ptr<const LightingSnapshot> snapshot, clock::time_point now = clock::now());
    std::shared_ptr<const LightingSnapshot> snapshot() const { return snapshot_; }

    void set_viewport(int w, int h);

    // Composes at most once per throttle interval and pumps discovery.
    // Returns true when a new frame was composed.
    bool update(clock::time_point now);

    void render(SDL_Renderer* renderer);

    void set_discovery_active(bool active);

    // Stops the redraw loop and releases the discovery thread without waiting on it.
    void shutdown();
    bool running() const { return running_; }

    LightCompositor& compositor() { return compositor_; }
    DiscoveryTracker& discovery() { return tracker_; }
    const DiscoveryTracker& discovery() const { return tracker_; }
    int last_discovered() const { return last_discovered_; }

	private:
    LightCompositor compositor_;
    DiscoveryTracker tracker_;
    FrameThrottle throttle_;
    std::shared_ptr<const LightingSnapshot> snapshot_;
    int viewport_w_;
    int viewport_h_;
    int last_discovered_ = 0;
    bool running_ = true;
    bool debugging = false;
};
