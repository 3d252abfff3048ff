#include "batchdl/signal_watcher.hpp"

#include <ctime>
#include <stdexcept>
#include <utility>

#include <pthread.h>

namespace batchdl {

sigset_t blockSignals(std::initializer_list<int> signals) {
    sigset_t set;
    sigemptyset(&set);
    for (const int sig : signals) {
        sigaddset(&set, sig);
    }
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0) {
        throw std::runtime_error("Failed to block signals");
    }
    return set;
}

SignalWatcher::SignalWatcher(sigset_t signals, std::function<void(int)> on_signal)
    : signals_(signals), on_signal_(std::move(on_signal)) {
    thread_ = std::thread([this]() { watchLoop(); });
}

SignalWatcher::~SignalWatcher() {
    done_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SignalWatcher::watchLoop() {
    while (!done_) {
        timespec timeout{0, 200000000};
        const int sig = sigtimedwait(&signals_, nullptr, &timeout);
        if (sig > 0 && on_signal_) {
            on_signal_(sig);
        }
    }
}

} // namespace batchdl
