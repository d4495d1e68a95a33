#include "lighting_scene.hpp"
#include <iostream>
#include <utility>

LightingScene::LightingScene(const LightingConfig& config,
                             int viewport_w,
                             int viewport_h,
                             bool start_discovery_thread)
: compositor_(config),
  tracker_(config.discovery, config.grid, start_discovery_thread),
  throttle_(config.frame_rate),
  viewport_w_(viewport_w),
  viewport_h_(viewport_h),
  debugging(config.debugging)
{
        if (debugging) {
                std::cout << "[LightingScene] " << viewport_w_ << "x" << viewport_h_
                          << " at " << config.frame_rate << " fps, discovery "
                          << (tracker_.worker().threaded() ? "threaded" : "inline") << "\n";
        }
}

LightingScene::~LightingScene() {
        shutdown();
}

void LightingScene::set_snapshot(std::shared_ptr<const LightingSnapshot> snapshot, clock::time_point now) {
        if (!running_ || !snapshot) return;
        snapshot_ = std::move(snapshot);
        tracker_.set_inputs(snapshot_->lights, snapshot_->discovery_blockers, now);
}

void LightingScene::set_viewport(int w, int h) {
        if (w <= 0 || h <= 0) return;
        viewport_w_ = w;
        viewport_h_ = h;
        throttle_.reset();
}

bool LightingScene::update(clock::time_point now) {
        if (!running_) return false;
        last_discovered_ = tracker_.update(now);
        if (last_discovered_ > 0 && debugging) {
                std::cout << "[LightingScene] discovered " << last_discovered_ << " cells\n";
        }
        if (!snapshot_ || !compositor_.enabled()) return false;
        if (!throttle_.ready(now)) return false;
        compositor_.compose(*snapshot_, viewport_w_, viewport_h_);
        return true;
}

void LightingScene::render(SDL_Renderer* renderer) {
        if (!running_) return;
        compositor_.present(renderer);
}

void LightingScene::set_discovery_active(bool active) {
        tracker_.set_active(active);
}

void LightingScene::shutdown() {
        if (!running_) return;
        running_ = false;
        tracker_.worker().stop();
        compositor_.release_textures();
        snapshot_.reset();
}
