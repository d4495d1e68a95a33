#include "frame_throttle.hpp"
#include <algorithm>

FrameThrottle::FrameThrottle(int frames_per_second) {
    set_rate(frames_per_second);
}

void FrameThrottle::set_rate(int frames_per_second) {
    const int fps = std::clamp(frames_per_second, 1, 240);
    interval_ = std::chrono::milliseconds(1000 / fps);
}

bool FrameThrottle::ready(clock::time_point now) {
    if (!started_) {
        started_ = true;
        last_ = now;
        return true;
    }
    if (now - last_ < interval_) return false;
    last_ = now;
    return true;
}

Debouncer::Debouncer(std::chrono::milliseconds delay)
    : delay_(delay) {}

void Debouncer::touch(clock::time_point now) {
    last_touch_ = now;
    pending_ = true;
}

bool Debouncer::fire(clock::time_point now) {
    if (!pending_) return false;
    if (now - last_touch_ < delay_) return false;
    pending_ = false;
    return true;
}
