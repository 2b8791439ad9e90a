#include "stop_token.hpp"
#include <algorithm>
#include <thread>

bool StopToken::wait_for(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;

    while (!stop_requested_) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kPollSlice));
    }
    return true;
}
