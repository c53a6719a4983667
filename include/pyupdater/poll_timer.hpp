#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace pyupdater {

// Invokes a callback on a dedicated thread every `interval` until stopped.
class PollTimer {
public:
    PollTimer() = default;
    ~PollTimer();

    PollTimer(const PollTimer&) = delete;
    PollTimer& operator=(const PollTimer&) = delete;

    // Restarts the timer if it is already running. The first tick happens one
    // interval after start. Must not be called from inside the callback.
    void start(std::chrono::milliseconds interval, std::function<void()> tick);
    // May be called from inside the callback; the thread is then joined by the
    // next start() or by the destructor.
    void stop();
    [[nodiscard]] bool isRunning() const;

private:
    void run(std::chrono::milliseconds interval, const std::function<void()>& tick);
    void joinWorker();

    std::thread worker_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool running_{false};
};

} // namespace pyupdater
