#include "batchdl/console_progress.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>

#include <fmt/format.h>

namespace batchdl {

ConsoleProgressReporter::ConsoleProgressReporter(std::size_t total_tasks, std::ostream& out)
    : total_tasks_(total_tasks), out_(out) {}

ConsoleProgressReporter::~ConsoleProgressReporter() { stop(); }

void ConsoleProgressReporter::start() {
    if (!renderer_.joinable()) {
        renderer_ = std::thread([this]() { renderProgressLoop(); });
    }
}

void ConsoleProgressReporter::stop() {
    stop_.requestStop();
    if (renderer_.joinable()) {
        renderer_.join();
    }
}

void ConsoleProgressReporter::onProgress(const Progress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_[progress.task_id] = progress;
}

void ConsoleProgressReporter::onTaskFinished(const TaskResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(result.task_id);
    ++finished_;
    if (!result.succeeded()) {
        ++failed_;
    }
}

void ConsoleProgressReporter::renderProgressLoop() {
    std::size_t previous_lines = 0;
    while (true) {
        redrawPanel(buildProgressPanel(), previous_lines);
        if (stop_.waitFor(std::chrono::milliseconds(200))) {
            break;
        }
    }
    redrawPanel(buildProgressPanel(), previous_lines);
    out_ << std::flush;
}

std::string ConsoleProgressReporter::buildProgressPanel() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string panel;
    panel.reserve(active_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Downloading {}/{} files ({} failed)\n", finished_, total_tasks_, failed_);
    panel.append("--------------------------------------------------\n");

    for (const auto& entry : active_) {
        panel += formatTaskLine(entry.second);
        panel.push_back('\n');
    }

    panel.append("--------------------------------------------------\n");
    if (total_tasks_ > 0) {
        const double ratio = static_cast<double>(finished_) / static_cast<double>(total_tasks_);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ConsoleProgressReporter::formatTaskLine(const Progress& progress) {
    std::string line;
    line.reserve(256);

    std::string display_name = std::filesystem::path{progress.filename}.filename().string();
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (progress.total_bytes && *progress.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(progress.downloaded_bytes) /
                                               static_cast<double>(*progress.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "█" : "░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                            display_name,
                            bar,
                            percent,
                            formatSize(progress.downloaded_bytes),
                            formatSize(*progress.total_bytes));
    } else {
        line += fmt::format("{:<20} [size unknown] {}", display_name, formatSize(progress.downloaded_bytes));
    }

    return line;
}

std::string ConsoleProgressReporter::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ConsoleProgressReporter::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        out_ << "\033[" << previous_lines << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines = current_lines;
}

} // namespace batchdl
