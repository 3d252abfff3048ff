#pragma once

#include "progress.hpp"
#include "stop_signal.hpp"
#include "task_result.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace batchdl {

// Redraws a panel of the in-flight transfers every 200 ms on a background thread.
class ConsoleProgressReporter final : public ProgressReporter {
public:
    explicit ConsoleProgressReporter(std::size_t total_tasks, std::ostream& out = std::cout);
    ~ConsoleProgressReporter() override;

    ConsoleProgressReporter(const ConsoleProgressReporter&) = delete;
    ConsoleProgressReporter& operator=(const ConsoleProgressReporter&) = delete;

    void start();
    // Draws the final panel and joins the render thread.
    void stop();

    void onProgress(const Progress& progress) override;
    void onTaskFinished(const TaskResult& result) override;

    [[nodiscard]] std::string buildProgressPanel() const;
    static std::string formatTaskLine(const Progress& progress);
    static std::string formatSize(std::uint64_t bytes);

private:
    void renderProgressLoop();
    void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    std::size_t total_tasks_;
    std::ostream& out_;

    mutable std::mutex mutex_;
    std::map<std::size_t, Progress> active_;
    std::size_t finished_{0};
    std::size_t failed_{0};

    StopSignal stop_;
    std::thread renderer_;
};

} // namespace batchdl
