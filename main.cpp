#include "common/logger.hpp"
#include "common/settings.hpp"
#include "sync/daemon_mode.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <pthread.h>
#include <thread>

int main(int argc, char** argv) {
    std::error_code ec;
    std::filesystem::path workingDir = std::filesystem::current_path(ec);
    if (ec) {
        std::cerr << "Error: cannot determine working directory: " << ec.message() << "\n";
        return 1;
    }

    auto parsed = parseArguments(argc, argv, workingDir);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.message << "\n" << usage();
        return 1;
    }
    const Settings& settings = parsed.data;
    if (settings.showHelp) {
        std::cout << usage();
        return 0;
    }

    // SIGINT/SIGTERM are taken off every thread and picked up by sigwait below,
    // so the daemon can stop between cycles instead of dying mid-copy
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    auto logger = Logger::init(settings.logFile, settings.verbose ? spdlog::level::debug : spdlog::level::info);
    DaemonMode daemon(settings, logger);

    // joined before daemon goes out of scope
    std::thread watcher([&daemon, stopSignals]() {
        int signal = 0;
        if (sigwait(&stopSignals, &signal) == 0) {
            daemon.stop();
        }
    });

    int status = daemon.start();
    // wake the watcher if no signal arrived; a pending stop signal is simply consumed
    pthread_kill(watcher.native_handle(), SIGTERM);
    watcher.join();
    logger->flush();
    return status;
}
