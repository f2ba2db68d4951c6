#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <signal.h>

class StopSignal {
public:
    void Request();
    bool Requested() const;

    // Returns true if stop was requested before the timeout elapsed.
    bool WaitFor(std::chrono::milliseconds timeout);

private:
    std::atomic<bool> requested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

// Blocks SIGINT and SIGTERM in the calling thread. Threads inherit the mask,
// so this must run before any other thread is created.
sigset_t BlockStopSignals();

// Waits for one of the blocked signals and requests stop.
std::thread StartSignalWaiter(const sigset_t& signals, StopSignal& stop);

// Wakes a waiter that is still blocked because no signal arrived.
void ReleaseSignalWaiter(std::thread& waiter);
