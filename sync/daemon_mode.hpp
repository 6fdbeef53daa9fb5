// Drives the engine: one cycle, then wait for the interval, until stop() is
// called. Cycles never overlap.

#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <spdlog/logger.h>
#include "sync_engine.hpp"
#include "../common/settings.hpp"

class DaemonMode {
public:
    DaemonMode(const Settings& settings, std::shared_ptr<spdlog::logger> logger);

    // Blocks until stop() (or after one cycle with --once). Returns the exit status.
    int start();

    // One cycle plus its summary line. False when the cycle could not run;
    // the error is logged and the caller may simply try again later.
    bool runOnce();

    // Safe to call from any thread; interrupts the wait between cycles
    void stop();

private:
    Settings settings_;
    std::shared_ptr<spdlog::logger> logger_;
    SyncEngine engine_;
    std::atomic<bool> stopRequested_;
    std::mutex mtx_;
    std::condition_variable cv_;

    bool checkFolders();
    void waitForNextCycle();
};
