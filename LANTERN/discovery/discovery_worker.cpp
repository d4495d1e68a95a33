#include "discovery_worker.hpp"
#include "discovery/discovery_engine.hpp"
#include <exception>
#include <iostream>
#include <system_error>
#include <utility>

DiscoveryWorker::DiscoveryWorker(Compute compute, bool start_thread)
: compute_(compute ? std::move(compute) : Compute(&DiscoveryEngine::compute_visible_cells)),
  box_(std::make_shared<Mailbox>())
{
        if (!start_thread) return;
        try {
                std::thread worker(&DiscoveryWorker::thread_main, box_, compute_);
                worker.detach();
                threaded_ = true;
        } catch (const std::system_error& e) {
                std::cerr << "[DiscoveryWorker] Could not start thread, computing inline: " << e.what() << "\n";
                threaded_ = false;
        }
}

DiscoveryWorker::~DiscoveryWorker() {
        stop();
}

void DiscoveryWorker::stop() {
        {
                std::lock_guard<std::mutex> lock(box_->mutex);
                box_->stopping = true;
                box_->pending.reset();
                box_->latest.reset();
        }
        box_->wake.notify_all();
        threaded_ = false;
}

void DiscoveryWorker::post(DiscoveryRequest request) {
        {
                std::lock_guard<std::mutex> lock(box_->mutex);
                if (box_->stopping) return;
                box_->pending = std::move(request);
        }
        box_->wake.notify_one();
}

std::optional<DiscoveryResponse> DiscoveryWorker::poll() {
        if (!threaded_) {
                std::optional<DiscoveryRequest> request;
                {
                        std::lock_guard<std::mutex> lock(box_->mutex);
                        if (!box_->stopping) request.swap(box_->pending);
                }
                if (request) {
                        auto response = run(compute_, *request);
                        if (response) {
                                std::lock_guard<std::mutex> lock(box_->mutex);
                                box_->latest = std::move(response);
                        }
                }
        }
        std::lock_guard<std::mutex> lock(box_->mutex);
        std::optional<DiscoveryResponse> out;
        out.swap(box_->latest);
        return out;
}

bool DiscoveryWorker::busy() const {
        std::lock_guard<std::mutex> lock(box_->mutex);
        return box_->in_flight || box_->pending.has_value();
}

void DiscoveryWorker::thread_main(std::shared_ptr<Mailbox> box, Compute compute) {
        for (;;) {
                DiscoveryRequest request;
                {
                        std::unique_lock<std::mutex> lock(box->mutex);
                        box->wake.wait(lock, [&box]() { return box->stopping || box->pending.has_value(); });
                        if (box->stopping) return;
                        request = std::move(*box->pending);
                        box->pending.reset();
                        box->in_flight = true;
                }
                auto response = run(compute, request);
                {
                        std::lock_guard<std::mutex> lock(box->mutex);
                        box->in_flight = false;
                        if (box->stopping) return;
                        if (response) box->latest = std::move(response);
                }
        }
}

std::optional<DiscoveryResponse> DiscoveryWorker::run(const Compute& compute, const DiscoveryRequest& request) {
        try {
                return compute(request);
        } catch (const std::exception& e) {
                std::cerr << "[DiscoveryWorker] Request " << request.sequence << " failed: " << e.what() << "\n";
        }
        return std::nullopt;
}
