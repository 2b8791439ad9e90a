#pragma once

#include <atomic>
#include <chrono>

// Cooperative cancellation for the session loop. request_stop() only touches
// a lock-free atomic, so it may be called from a signal handler.
class StopToken {
public:
    void request_stop() { stop_requested_ = true; }
    bool stop_requested() const { return stop_requested_; }

    // Sleeps up to `duration`, waking early on a stop request.
    // Returns true if a stop was requested.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> stop_requested_{false};

    static constexpr std::chrono::milliseconds kPollSlice{200};
};
