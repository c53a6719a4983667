#pragma once

#include "calendar.hpp"
#include "poll_timer.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>

namespace pyupdater {

struct ScheduleOptions {
    // A poll fires when the time of day lies in [target, target + tolerance).
    std::chrono::minutes tolerance{2};
    // Zero disables the internal timer; the owner then calls poll() itself.
    std::chrono::milliseconds poll_interval{std::chrono::minutes{1}};
};

// Decides when the once-a-day scheduled check runs.
//
// Disabled until start(). While armed, poll() fires at most once per calendar
// date; triggerNow() counts as that date's firing. Listeners are called
// without the internal lock held, on whichever thread polled.
class ScheduleGate {
public:
    using Clock = std::function<LocalDateTime()>;
    using FireCallback = std::function<void(const Date& fired_on)>;
    using NextFiringCallback = std::function<void(const std::optional<LocalDateTime>& next)>;

    static constexpr TimeOfDay kDefaultTarget{9, 0, 0};

    explicit ScheduleGate(ScheduleOptions options = {}, Clock clock = &LocalDateTime::now);
    ~ScheduleGate();

    ScheduleGate(const ScheduleGate&) = delete;
    ScheduleGate& operator=(const ScheduleGate&) = delete;

    void setTargetTime(const TimeOfDay& target);
    // Falls back to 09:00 when `text` is not HH:MM; returns whether it parsed.
    bool setTargetTime(std::string_view text);
    [[nodiscard]] std::optional<TimeOfDay> targetTime() const;

    void setTolerance(std::chrono::minutes tolerance);
    [[nodiscard]] std::chrono::minutes tolerance() const;

    void setLastFiredDate(std::optional<Date> date);
    [[nodiscard]] std::optional<Date> lastFiredDate() const;

    void onFire(FireCallback callback);
    void onNextFiringChanged(NextFiringCallback callback);

    void start();
    void stop();
    [[nodiscard]] bool isEnabled() const;

    // Returns true when the gate fired for `now`.
    bool poll(const LocalDateTime& now);
    [[nodiscard]] std::optional<LocalDateTime> nextFiringInstant(const LocalDateTime& now) const;

    void triggerNow();
    void triggerNow(const LocalDateTime& now);

private:
    [[nodiscard]] std::optional<LocalDateTime> nextFiringLocked(const LocalDateTime& now) const;
    void fire(const Date& date, std::unique_lock<std::mutex>& lock);
    void notifyNextFiring();

    ScheduleOptions options_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::optional<TimeOfDay> target_;
    std::optional<Date> last_fired_;
    bool enabled_{false};
    FireCallback on_fire_;
    NextFiringCallback on_next_firing_;

    PollTimer timer_;
};

} // namespace pyupdater
