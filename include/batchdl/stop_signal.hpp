#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace batchdl {

class StopSignal {
public:
    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool stopRequested() const noexcept { return stopped_.load(); }

    // Sleeps for at most `timeout`. Returns true when woken by a stop request.
    template <class Rep, class Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stopped_.load(); });
    }

private:
    std::atomic<bool> stopped_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace batchdl
