#include "StopSignal.hpp"

#include <iostream>

#include <pthread.h>

void StopSignal::Request() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requested_.store(true);
    }
    cv_.notify_all();
}

bool StopSignal::Requested() const {
    return requested_.load();
}

bool StopSignal::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return requested_.load(); });
}

sigset_t BlockStopSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    const int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    if (rc != 0) {
        std::cerr << "[Watch] Unable to block stop signals (error " << rc << ")." << std::endl;
    }
    return signals;
}

std::thread StartSignalWaiter(const sigset_t& signals, StopSignal& stop) {
    return std::thread([signals, &stop]() {
        int received = 0;
        if (sigwait(&signals, &received) == 0 && !stop.Requested()) {
            std::cout << "[Watch] Received signal " << received << ", shutting down." << std::endl;
        }
        stop.Request();
    });
}

void ReleaseSignalWaiter(std::thread& waiter) {
    if (!waiter.joinable()) {
        return;
    }
    pthread_kill(waiter.native_handle(), SIGTERM);
    waiter.join();
}
