#include "daemon_mode.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

DaemonMode::DaemonMode(const Settings& settings, std::shared_ptr<spdlog::logger> logger)
    : settings_(settings), logger_(logger), engine_(settings.sourceFolder, settings.replicaFolder, logger), stopRequested_(false) {}

int DaemonMode::start() {
    logger_->info("Source Folder: {}", settings_.sourceFolder);
    logger_->info("Replica Folder: {}", settings_.replicaFolder);
    logger_->info("Log File: {}", settings_.logFile);
    logger_->info("Sync Interval: {} seconds", settings_.syncInterval);

    if (!checkFolders()) return 1;

    logger_->info("Starting folder synchronization.");
    if (settings_.runOnce) {
        return runOnce() ? 0 : 1;
    }

    while (!stopRequested_) {
        // a failed cycle is logged inside runOnce; the next interval retries it
        runOnce();
        waitForNextCycle();
    }
    logger_->info("Stopping folder synchronization.");
    return 0;
}

bool DaemonMode::runOnce() {
    try {
        auto result = engine_.runCycle();
        if (!result.success) {
            logger_->error("An error occurred: {}", result.message);
            return false;
        }

        const CycleReport& report = result.data;
        if (report.failures() > 0) {
            logger_->warn("{} entries could not be synchronized, they will be retried next cycle", report.failures());
        }
        if (report.changed()) {
            logger_->info("Changes detected and synchronized.");
        } else {
            logger_->info("No changes detected.");
        }
        return true;
    } catch (const std::exception& e) {
        logger_->error("An error occurred: {}", e.what());
        return false;
    }
}

void DaemonMode::stop() {
    {
        std::lock_guard<std::mutex> guard(mtx_);
        stopRequested_ = true;
    }
    cv_.notify_all();
}

bool DaemonMode::checkFolders() {
    std::error_code ec;
    if (!fs::is_directory(settings_.sourceFolder, ec)) {
        logger_->error("Error: Source folder '{}' does not exist.", settings_.sourceFolder);
        return false;
    }

    if (!fs::exists(settings_.replicaFolder, ec)) {
        logger_->info("Replica folder '{}' does not exist. Creating it...", settings_.replicaFolder);
        fs::create_directories(settings_.replicaFolder, ec);
        if (ec) {
            logger_->error("Error: cannot create replica folder '{}': {}", settings_.replicaFolder, ec.message());
            return false;
        }
    }
    return true;
}

void DaemonMode::waitForNextCycle() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, std::chrono::seconds(settings_.syncInterval), [this]() {
        return stopRequested_.load();
    });
}
