#pragma once

#include "download_manager.hpp"
#include "installer.hpp"
#include "schedule_gate.hpp"
#include "settings.hpp"
#include "version_checker.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>

namespace pyupdater {

struct UpdateServiceOptions {
    DownloadOptions download;
    ScheduleOptions schedule;
    InstallOptions install;
    // Overrides the download_dir setting without persisting it.
    std::optional<std::filesystem::path> download_dir;
};

// Ties version lookup, download, installation and the daily schedule together.
//
// At most one version check and one download run at a time, each on its own
// worker. Listeners are called on the worker that produced the event.
class UpdateService {
public:
    using CheckListener = std::function<void(const UpdateCheck&)>;
    using InstallListener = std::function<void(const std::filesystem::path& installer, bool launched)>;
    using ErrorListener = std::function<void(const std::string& message)>;

    UpdateService(SettingsStore& settings, VersionSourcePtr source, UpdateServiceOptions options = {});
    ~UpdateService();

    UpdateService(const UpdateService&) = delete;
    UpdateService& operator=(const UpdateService&) = delete;

    // Throws std::runtime_error when a check is already running.
    std::future<UpdateCheck> checkForUpdatesAsync();

    // Empty result when no installer exists for `version`. The future carries
    // DownloadError on failure or cancellation. Throws std::runtime_error when
    // a download is already running.
    std::future<std::optional<std::filesystem::path>> downloadAsync(
        const RuntimeVersion& version,
        ProgressCallback on_progress = {},
        std::optional<std::string> expected_sha256 = std::nullopt);

    void cancelDownload() noexcept;

    [[nodiscard]] bool install(const std::filesystem::path& installer);

    // Pushes the persisted schedule into the gate and arms or disarms it.
    void applySchedule();
    // Manual check: counts as today's firing.
    void checkNow();

    // Blocks until a scheduled check started by a firing has finished.
    void waitForScheduledWork();

    [[nodiscard]] ScheduleGate& scheduler() { return gate_; }
    [[nodiscard]] DownloadManager& downloads() { return downloads_; }

    void onCheckCompleted(CheckListener listener);
    void onInstallFinished(InstallListener listener);
    void onError(ErrorListener listener);

private:
    // Downloads and verifies; throws DownloadError.
    std::filesystem::path fetchInstaller(const std::string& url,
                                         const ProgressCallback& on_progress,
                                         const std::optional<std::string>& expected_sha256);
    void handleFiring(const Date& fired_on);
    void runScheduledCheck();
    void reportError(const std::string& message);

    SettingsStore& settings_;
    VersionSourcePtr source_;
    UpdateServiceOptions options_;
    DownloadManager downloads_;

    std::mutex mutex_;
    CheckListener on_check_;
    InstallListener on_install_;
    ErrorListener on_error_;
    std::future<void> scheduled_job_;

    std::atomic<bool> check_in_flight_{false};
    std::atomic<bool> download_in_flight_{false};

    // Last member: its timer thread calls back into the members above.
    ScheduleGate gate_;
};

} // namespace pyupdater
