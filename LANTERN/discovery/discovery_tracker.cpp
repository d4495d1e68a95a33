#include "discovery_tracker.hpp"
#include <utility>

namespace {

bool same_lights(const std::vector<DiscoveryLight>& a, const std::vector<DiscoveryLight>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].x != b[i].x || a[i].y != b[i].y ||
            a[i].radius != b[i].radius || a[i].intensity != b[i].intensity) {
            return false;
        }
    }
    return true;
}

}

DiscoveryTracker::DiscoveryTracker(const DiscoverySettings& settings, const GridSettings& grid, bool start_thread)
: settings_(settings),
  grid_(grid.cols, grid.rows, grid.cell_size),
  worker_(DiscoveryWorker::Compute{}, start_thread),
  debounce_(std::chrono::milliseconds(settings.debounce_ms))
{
    grid_.set_persist(settings_.persist);
}

void DiscoveryTracker::set_inputs(const std::vector<LightSource>& lights,
                                  const std::vector<Blocker>& blockers,
                                  clock::time_point now) {
    std::vector<DiscoveryLight> next;
    next.reserve(lights.size());
    for (const auto& light : sanitize_lights(lights)) {
        next.push_back(to_discovery_light(light));
    }
    if (same_lights(next, lights_) && blockers == blockers_ && has_inputs_) return;
    has_inputs_ = true;
    lights_ = std::move(next);
    blockers_ = blockers;
    debounce_.touch(now);
}

DiscoveryRequest DiscoveryTracker::build_request() {
    DiscoveryRequest request;
    request.lights = lights_;
    request.blockers = blockers_;
    request.rows = grid_.rows();
    request.cols = grid_.cols();
    request.cell_size = grid_.cell_size();
    request.world_width = grid_.world_width();
    request.world_height = grid_.world_height();
    request.intensity_threshold = settings_.intensity_threshold;
    request.ambient = settings_.ambient;
    request.blocker_opacity = settings_.blocker_opacity;
    request.occlusion = settings_.occlusion;
    request.sequence = ++sequence_;
    return request;
}

int DiscoveryTracker::update(clock::time_point now) {
    if (!active_) return 0;
    if (debounce_.fire(now)) {
        worker_.post(build_request());
    }
    auto response = worker_.poll();
    if (!response || response->sequence <= applied_sequence_) return 0;
    applied_sequence_ = response->sequence;
    return grid_.apply_visible(response->visible);
}

void DiscoveryTracker::set_active(bool active, clock::time_point now) {
    if (active_ == active) return;
    active_ = active;
    if (!active_) {
        grid_.clear_visible();
        return;
    }
    debounce_.touch(now);
}
