#include "pyupdater/poll_timer.hpp"

#include <utility>

namespace pyupdater {

PollTimer::~PollTimer() {
    stop();
    joinWorker();
}

void PollTimer::start(std::chrono::milliseconds interval, std::function<void()> tick) {
    stop();
    joinWorker();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = true;
    }
    worker_ = std::thread([this, interval, tick = std::move(tick)]() { run(interval, tick); });
}

void PollTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    wake_.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool PollTimer::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PollTimer::run(std::chrono::milliseconds interval, const std::function<void()>& tick) {
    auto next = std::chrono::steady_clock::now() + interval;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (wake_.wait_until(lock, next, [this] { return !running_; })) {
                return;
            }
        }

        tick();
        next += interval;
        const auto now = std::chrono::steady_clock::now();
        if (next < now) {
            next = now + interval;
        }
    }
}

void PollTimer::joinWorker() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

} // namespace pyupdater
