#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <thread>

namespace batchdl {

// Blocks `signals` in the calling thread. Threads started afterwards inherit the mask.
// Throws std::runtime_error on failure.
sigset_t blockSignals(std::initializer_list<int> signals);

// Consumes signals blocked by blockSignals() on a background thread and forwards them to a callback.
// A signal that arrived while blocked but before the watcher started is delivered once it runs.
class SignalWatcher {
public:
    SignalWatcher(sigset_t signals, std::function<void(int)> on_signal);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void watchLoop();

    sigset_t signals_;
    std::function<void(int)> on_signal_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace batchdl
