#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "discovery/discovery_types.hpp"

/*
  one background thread per view
  single slot mailbox: a newer post replaces an unprocessed one
  poll() hands back the newest finished response once
  stop() never waits for the computation in flight; the detached thread keeps
  its own reference to the mailbox and its late result is dropped
*/

class DiscoveryWorker {

	public:
    using Compute = std::function<DiscoveryResponse(const DiscoveryRequest&)>;

    // Starts the thread unless start_thread is false, in which case requests
    // are computed on the polling thread.
    explicit DiscoveryWorker(Compute compute = Compute{}, bool start_thread = true);
    ~DiscoveryWorker();

    DiscoveryWorker(const DiscoveryWorker&) = delete;
    DiscoveryWorker& operator=(const DiscoveryWorker&) = delete;

    void post(DiscoveryRequest request);
    std::optional<DiscoveryResponse> poll();

    bool threaded() const { return threaded_; }
    bool busy() const;
    void stop();

	private:
    struct Mailbox {
        std::mutex mutex;
        std::condition_variable wake;
        std::optional<DiscoveryRequest> pending;
        std::optional<DiscoveryResponse> latest;
        bool in_flight = false;
        bool stopping = false;
    };

    static void thread_main(std::shared_ptr<Mailbox> box, Compute compute);
    static std::optional<DiscoveryResponse> run(const Compute& compute, const DiscoveryRequest& request);

	private:
    Compute compute_;
    std::shared_ptr<Mailbox> box_;
    bool threaded_ = false;
};
