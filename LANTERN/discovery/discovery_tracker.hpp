#pragma once

#include <chrono>
#include <cstdint>
#include <vector>
#include "core/lighting_config.hpp"
#include "discovery/discovery_worker.hpp"
#include "utils/discovery_grid.hpp"
#include "utils/frame_throttle.hpp"

/*
  drives the discovery worker for one view
  inputs are debounced, responses are folded into the grid by union
*/

class DiscoveryTracker {

	public:
    using clock = std::chrono::steady_clock;

    DiscoveryTracker(const DiscoverySettings& settings, const GridSettings& grid, bool start_thread = true);

    // Restarts the debounce only when lights or blockers actually changed.
    void set_inputs(const std::vector<LightSource>& lights,
                    const std::vector<Blocker>& blockers,
                    clock::time_point now);

    // Posts a request once the debounce elapsed and applies the newest
    // response. Returns the number of newly discovered cells.
    int update(clock::time_point now);

    void set_active(bool active, clock::time_point now = clock::now());
    bool active() const { return active_; }

    const DiscoveryGrid& grid() const { return grid_; }
    DiscoveryGrid& grid() { return grid_; }
    DiscoveryWorker& worker() { return worker_; }

    uint64_t last_posted() const { return sequence_; }
    uint64_t last_applied() const { return applied_sequence_; }

	private:
    DiscoveryRequest build_request();

	private:
    DiscoverySettings settings_;
    DiscoveryGrid grid_;
    DiscoveryWorker worker_;
    Debouncer debounce_;
    std::vector<DiscoveryLight> lights_;
    std::vector<Blocker> blockers_;
    uint64_t sequence_ = 0;
    uint64_t applied_sequence_ = 0;
    bool has_inputs_ = false;
    bool active_ = true;
};
