// Helpers shared by the event-loop test executables (run via CTest).
#pragma once
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QThread>
#include "twinpane/MockSftpClient.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <iostream>
#include <string>

namespace testsupport {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

// Spins the Qt event loop until pred() holds or timeoutMs elapses.
inline bool waitUntil(const std::function<bool()> &pred, int timeoutMs = 5000) {
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeoutMs)
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

// Lets queued events run for a while without a stop condition.
inline void pumpEvents(int ms) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
}

// Blocks the worker inside the session at a given checkpoint until open().
struct Gate {
    std::shared_ptr<std::promise<void>> reached =
        std::make_shared<std::promise<void>>();
    std::shared_ptr<std::promise<void>> release =
        std::make_shared<std::promise<void>>();
    std::shared_future<void> released = release->get_future().share();
    std::future<void> reachedFuture = reached->get_future();
    bool opened = false;

    twinpane::MockSftpClient::CheckpointHook hookAt(std::uint64_t at) {
        auto r = reached;
        auto f = released;
        auto fired = std::make_shared<std::atomic<bool>>(false);
        return [r, f, at, fired](const std::string &, std::uint64_t done) {
            if (done == at && !fired->exchange(true)) {
                r->set_value();
                f.wait();
            }
        };
    }
    bool waitReached() {
        return reachedFuture.wait_for(std::chrono::seconds(5)) ==
               std::future_status::ready;
    }
    void open() {
        if (!opened) {
            opened = true;
            release->set_value();
        }
    }
};

} // namespace testsupport
