#include "pyupdater/schedule_gate.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace pyupdater {

ScheduleGate::ScheduleGate(ScheduleOptions options, Clock clock)
    : options_(options), clock_(std::move(clock)) {
    options_.tolerance = std::max(options_.tolerance, std::chrono::minutes{1});
}

ScheduleGate::~ScheduleGate() { timer_.stop(); }

void ScheduleGate::setTargetTime(const TimeOfDay& target) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target_ = TimeOfDay{target.hour, target.minute, 0};
    }
    notifyNextFiring();
}

bool ScheduleGate::setTargetTime(std::string_view text) {
    const auto parsed = TimeOfDay::parse(text);
    if (!parsed) {
        spdlog::warn("Invalid scheduled time '{}', using {}", text, kDefaultTarget.toString());
    }
    setTargetTime(parsed.value_or(kDefaultTarget));
    return parsed.has_value();
}

std::optional<TimeOfDay> ScheduleGate::targetTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_;
}

void ScheduleGate::setTolerance(std::chrono::minutes tolerance) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.tolerance = std::max(tolerance, std::chrono::minutes{1});
}

std::chrono::minutes ScheduleGate::tolerance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_.tolerance;
}

void ScheduleGate::setLastFiredDate(std::optional<Date> date) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_fired_ = date;
    }
    notifyNextFiring();
}

std::optional<Date> ScheduleGate::lastFiredDate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_fired_;
}

void ScheduleGate::onFire(FireCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_fire_ = std::move(callback);
}

void ScheduleGate::onNextFiringChanged(NextFiringCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_next_firing_ = std::move(callback);
}

void ScheduleGate::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (enabled_) {
            return;
        }
        enabled_ = true;
    }
    if (options_.poll_interval.count() > 0) {
        timer_.start(options_.poll_interval, [this] { poll(clock_()); });
    }
    spdlog::info("Scheduled checks enabled");
    notifyNextFiring();
}

void ScheduleGate::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_) {
            return;
        }
        enabled_ = false;
    }
    timer_.stop();
    spdlog::info("Scheduled checks disabled");
    notifyNextFiring();
}

bool ScheduleGate::isEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

bool ScheduleGate::poll(const LocalDateTime& now) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!enabled_ || !target_) {
        return false;
    }
    if (last_fired_ && *last_fired_ == now.date) {
        return false;
    }

    const int target = target_->minutesSinceMidnight();
    const int current = now.time.minutesSinceMidnight();
    if (current < target || current >= target + static_cast<int>(options_.tolerance.count())) {
        return false;
    }

    spdlog::info("Scheduled check due ({} >= {})", now.toString(), target_->toString());
    fire(now.date, lock);
    return true;
}

std::optional<LocalDateTime> ScheduleGate::nextFiringInstant(const LocalDateTime& now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextFiringLocked(now);
}

std::optional<LocalDateTime> ScheduleGate::nextFiringLocked(const LocalDateTime& now) const {
    if (!enabled_ || !target_) {
        return std::nullopt;
    }

    const LocalDateTime today{now.date, *target_};
    const bool fired_today = last_fired_ && *last_fired_ == now.date;
    if (now < today && !fired_today) {
        return today;
    }
    return LocalDateTime{now.date.nextDay(), *target_};
}

void ScheduleGate::triggerNow() { triggerNow(clock_()); }

void ScheduleGate::triggerNow(const LocalDateTime& now) {
    std::unique_lock<std::mutex> lock(mutex_);
    spdlog::info("Check triggered manually at {}", now.toString());
    fire(now.date, lock);
}

void ScheduleGate::fire(const Date& date, std::unique_lock<std::mutex>& lock) {
    last_fired_ = date;
    FireCallback on_fire = on_fire_;
    lock.unlock();

    if (on_fire) {
        on_fire(date);
    }
    notifyNextFiring();
}

void ScheduleGate::notifyNextFiring() {
    NextFiringCallback callback;
    std::optional<LocalDateTime> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!on_next_firing_) {
            return;
        }
        callback = on_next_firing_;
        next = nextFiringLocked(clock_());
    }
    callback(next);
}

} // namespace pyupdater
