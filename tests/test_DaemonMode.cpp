#include "TestTree.hpp"
#include "sync/daemon_mode.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <pthread.h>
#include <thread>

class DaemonModeTest : public TestTree {
protected:
    Settings settingsFor(bool once) {
        Settings settings;
        settings.sourceFolder = (scratch / "source").string();
        settings.replicaFolder = (scratch / "replica").string();
        settings.logFile = (scratch / "log.txt").string();
        settings.syncInterval = 3600;
        settings.runOnce = once;
        return settings;
    }
};

TEST_F(DaemonModeTest, MissingSourceIsFatal) {
    DaemonMode daemon(settingsFor(true), logger);
    EXPECT_EQ(daemon.start(), 1);
    EXPECT_NE(log().find("does not exist"), std::string::npos);
    EXPECT_FALSE(fs::exists(scratch / "replica"));
}

TEST_F(DaemonModeTest, SingleCycleRun) {
    writeFile(scratch / "source" / "a.txt", "hello");
    DaemonMode daemon(settingsFor(true), logger);

    EXPECT_EQ(daemon.start(), 0);
    EXPECT_EQ(readFile(scratch / "replica" / "a.txt"), "hello");
    EXPECT_NE(log().find("Replica folder '" + (scratch / "replica").string() + "' does not exist. Creating it..."),
              std::string::npos);
    EXPECT_NE(log().find("Sync Interval: 3600 seconds"), std::string::npos);
    EXPECT_NE(log().find("Changes detected and synchronized."), std::string::npos);
}

TEST_F(DaemonModeTest, RunOnceSummaries) {
    writeFile(scratch / "source" / "a.txt", "hello");
    DaemonMode daemon(settingsFor(true), logger);

    EXPECT_TRUE(daemon.runOnce());
    EXPECT_NE(log().find("Changes detected and synchronized."), std::string::npos);
    EXPECT_EQ(log().find("No changes detected."), std::string::npos);

    EXPECT_TRUE(daemon.runOnce());
    EXPECT_NE(log().find("No changes detected."), std::string::npos);
}

TEST_F(DaemonModeTest, FailedCycleIsReportedNotThrown) {
    DaemonMode daemon(settingsFor(true), logger);
    EXPECT_FALSE(daemon.runOnce());
    EXPECT_NE(log().find("An error occurred"), std::string::npos);
}

TEST_F(DaemonModeTest, StopInterruptsTheWait) {
    writeFile(scratch / "source" / "a.txt", "hello");
    DaemonMode daemon(settingsFor(false), logger);

    auto running = std::async(std::launch::async, [&daemon]() { return daemon.start(); });

    // wait for the first cycle to land before stopping
    for (int i = 0; i < 500 && !fs::exists(scratch / "replica" / "a.txt"); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    daemon.stop();

    ASSERT_EQ(running.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_EQ(running.get(), 0);
    EXPECT_EQ(readFile(scratch / "replica" / "a.txt"), "hello");
}

// Same shape as main(): a sigwait watcher that owns a reference to the daemon
// is woken and joined once the run returns, before the daemon is destroyed.
TEST_F(DaemonModeTest, SignalWatcherIsJoinedAfterTheRun) {
    writeFile(scratch / "source" / "a.txt", "hello");

    sigset_t wakeSignals;
    sigemptyset(&wakeSignals);
    sigaddset(&wakeSignals, SIGUSR1);
    sigset_t previous;
    ASSERT_EQ(pthread_sigmask(SIG_BLOCK, &wakeSignals, &previous), 0);

    std::atomic<bool> woke{false};
    {
        DaemonMode daemon(settingsFor(true), logger);
        std::thread watcher([&daemon, &woke, wakeSignals]() {
            int signal = 0;
            if (sigwait(&wakeSignals, &signal) == 0) {
                daemon.stop();
                woke = true;
            }
        });

        EXPECT_EQ(daemon.start(), 0);
        pthread_kill(watcher.native_handle(), SIGUSR1);
        watcher.join();
    }

    pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    EXPECT_TRUE(woke);
    EXPECT_EQ(readFile(scratch / "replica" / "a.txt"), "hello");
}
