#pragma once

#include <chrono>

/*
  time gates driven by an explicit clock value so callers and tests control time
*/

class FrameThrottle {
public:
    using clock = std::chrono::steady_clock;

    explicit FrameThrottle(int frames_per_second);

    void set_rate(int frames_per_second);
    std::chrono::milliseconds interval() const { return interval_; }

    // True at most once per interval; the first call always passes.
    bool ready(clock::time_point now);
    void reset() { started_ = false; }

private:
    std::chrono::milliseconds interval_{33};
    clock::time_point last_{};
    bool started_ = false;
};

class Debouncer {
public:
    using clock = std::chrono::steady_clock;

    explicit Debouncer(std::chrono::milliseconds delay);

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }
    std::chrono::milliseconds delay() const { return delay_; }

    // Restarts the quiet period.
    void touch(clock::time_point now);

    // True once when the quiet period after the last touch has elapsed.
    bool fire(clock::time_point now);

    bool pending() const { return pending_; }
    void cancel() { pending_ = false; }

private:
    std::chrono::milliseconds delay_;
    clock::time_point last_touch_{};
    bool pending_ = false;
};
