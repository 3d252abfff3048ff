#include "batchdl/console_progress.hpp"
#include "batchdl/curl_transport.hpp"
#include "batchdl/event_log.hpp"
#include "batchdl/failure.hpp"
#include "batchdl/settings.hpp"
#include "batchdl/signal_watcher.hpp"
#include "batchdl/url_list.hpp"
#include "batchdl/worker_pool.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [-l <log file>] [--no-progress] <config file>" << std::endl;
    std::cerr << "Options:\n"
              << "  -l, --log-file <file>  Log file (default: download.log)\n"
              << "  --no-progress          Do not draw the progress panel\n"
              << "  -h, --help             Show this message" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::filesystem::path log_file = "download.log";
        bool show_progress = true;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-l" || option == "--log-file") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                log_file = argv[arg_index + 1];
                arg_index += 2;
            } else if (option == "--no-progress") {
                show_progress = false;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (argc - arg_index != 1) {
            printUsage(argv[0]);
            return 1;
        }

        auto logger = batchdl::makeLogger(log_file, true);
        batchdl::SpdlogEventLog event_log(logger);

        batchdl::Settings settings;
        std::vector<std::string> urls;
        try {
            settings = batchdl::loadSettings(argv[arg_index]);
            urls = batchdl::readUrlList(settings.input_file);
        } catch (const batchdl::ConfigError& ex) {
            logger->critical("Invalid configuration: {}", ex.what());
            return 1;
        }
        logger->info("Loaded {} URL(s) from {}", urls.size(), settings.input_file.string());

        batchdl::PoolOptions options;
        options.max_workers = settings.max_workers;
        options.downloads_folder = settings.downloads_folder;
        options.task.timeouts.connect = settings.connect_timeout;
        options.task.timeouts.read = settings.read_timeout;
        options.task.retry = batchdl::RetryPolicy(settings.retry_count, settings.retry_delay);

        batchdl::CurlTransport transport;
        batchdl::NullProgressReporter no_progress;
        std::unique_ptr<batchdl::ConsoleProgressReporter> panel;
        batchdl::ProgressReporter* progress = &no_progress;
        if (show_progress && isatty(STDOUT_FILENO) && !urls.empty()) {
            // Keep the console quiet below warnings so log lines do not tear the panel.
            logger->sinks().front()->set_level(spdlog::level::warn);
            panel = std::make_unique<batchdl::ConsoleProgressReporter>(urls.size());
            progress = panel.get();
        }

        // Until here the default signal action applies; nothing is in flight yet.
        // The mask must be in place before any thread starts so every thread inherits it.
        const sigset_t signals = batchdl::blockSignals({SIGINT, SIGTERM});
        batchdl::WorkerPool pool(std::move(options), transport, event_log, *progress);
        batchdl::SignalWatcher watcher(signals, [&pool, &logger](int sig) {
            logger->warn("Received signal {}, stopping after in-flight transfers abort", sig);
            pool.requestStop();
        });
        if (panel) {
            panel->start();
        }

        const batchdl::RunSummary summary = pool.run(urls);
        if (panel) {
            panel->stop();
        }
        return summary.allSucceeded() ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
