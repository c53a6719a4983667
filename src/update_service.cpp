#include "pyupdater/update_service.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pyupdater {

namespace {

// Clears an in-flight flag when the owning worker finishes.
class InFlightReset {
public:
    explicit InFlightReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightReset() { flag_.store(false); }

    InFlightReset(const InFlightReset&) = delete;
    InFlightReset& operator=(const InFlightReset&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

UpdateService::UpdateService(SettingsStore& settings, VersionSourcePtr source, UpdateServiceOptions options)
    : settings_(settings),
      source_(std::move(source)),
      options_(options),
      downloads_(options.download),
      gate_(options.schedule) {
    if (!source_) {
        throw std::invalid_argument("UpdateService requires a version source");
    }
    gate_.onFire([this](const Date& fired_on) { handleFiring(fired_on); });
}

UpdateService::~UpdateService() {
    gate_.stop();
    downloads_.cancel();
    waitForScheduledWork();
}

std::future<UpdateCheck> UpdateService::checkForUpdatesAsync() {
    if (check_in_flight_.exchange(true)) {
        throw std::runtime_error("A version check is already running");
    }

    try {
        return std::async(std::launch::async, [this] {
            InFlightReset reset{check_in_flight_};
            UpdateCheck result = checkForUpdates(*source_);

            CheckListener listener;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                listener = on_check_;
            }
            if (listener) {
                listener(result);
            }
            return result;
        });
    } catch (...) {
        check_in_flight_.store(false);
        throw;
    }
}

std::future<std::optional<std::filesystem::path>> UpdateService::downloadAsync(
    const RuntimeVersion& version,
    ProgressCallback on_progress,
    std::optional<std::string> expected_sha256) {
    if (download_in_flight_.exchange(true)) {
        throw std::runtime_error("A download is already running");
    }
    // Cleared before the worker starts; a cancel issued while the installer URL
    // resolves stays pending.
    downloads_.reset();

    try {
        return std::async(std::launch::async,
                          [this, version, on_progress = std::move(on_progress),
                           expected_sha256 = std::move(expected_sha256)] {
                              InFlightReset reset{download_in_flight_};
                              std::optional<std::filesystem::path> installer;
                              const auto url = source_->installerUrl(version);
                              if (!url) {
                                  spdlog::warn("No installer available for {}", version.toString());
                                  return installer;
                              }
                              installer = fetchInstaller(*url, on_progress, expected_sha256);
                              return installer;
                          });
    } catch (...) {
        download_in_flight_.store(false);
        throw;
    }
}

void UpdateService::cancelDownload() noexcept { downloads_.cancel(); }

bool UpdateService::install(const std::filesystem::path& installer) {
    const bool launched = launchInstaller(installer, options_.install);

    InstallListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = on_install_;
    }
    if (listener) {
        listener(installer, launched);
    }
    return launched;
}

void UpdateService::applySchedule() {
    const AppSettings& settings = settings_.settings();

    gate_.setTargetTime(settings.scheduled_time);
    gate_.setTolerance(std::chrono::minutes{settings.schedule_tolerance_minutes});
    if (settings.last_check_date.empty()) {
        gate_.setLastFiredDate(std::nullopt);
    } else {
        const auto date = Date::parseIso(settings.last_check_date);
        if (!date) {
            spdlog::warn("Ignoring malformed last_check_date '{}'", settings.last_check_date);
        }
        gate_.setLastFiredDate(date);
    }

    if (settings.auto_update_enabled) {
        gate_.start();
    } else {
        gate_.stop();
    }
}

void UpdateService::checkNow() { gate_.triggerNow(); }

void UpdateService::waitForScheduledWork() {
    std::future<void> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = std::move(scheduled_job_);
    }
    if (job.valid()) {
        job.wait();
    }
}

void UpdateService::onCheckCompleted(CheckListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_check_ = std::move(listener);
}

void UpdateService::onInstallFinished(InstallListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_install_ = std::move(listener);
}

void UpdateService::onError(ErrorListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_error_ = std::move(listener);
}

std::filesystem::path UpdateService::fetchInstaller(const std::string& url,
                                                   const ProgressCallback& on_progress,
                                                   const std::optional<std::string>& expected_sha256) {
    const std::filesystem::path destination_dir =
        options_.download_dir.value_or(std::filesystem::path{settings_.settings().download_dir});
    std::filesystem::path installer = downloads_.download(url, destination_dir, on_progress);
    if (!DownloadManager::verify(installer, expected_sha256)) {
        downloads_.cleanup();
        throw DownloadError("Downloaded installer failed verification: " + installer.string());
    }
    return installer;
}

void UpdateService::handleFiring(const Date& fired_on) {
    try {
        settings_.setLastCheckDate(fired_on.toIsoString());
    } catch (const std::exception& ex) {
        reportError(fmt::format("Could not record last check date: {}", ex.what()));
    }

    if (check_in_flight_.exchange(true)) {
        reportError("A version check is already running");
        return;
    }

    std::future<void> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(scheduled_job_);
    }
    // Only possible when a job is finishing up; its check flag is already clear.
    if (previous.valid()) {
        previous.wait();
    }
    // A cancel issued during the version check stops the download that follows.
    if (!download_in_flight_.load()) {
        downloads_.reset();
    }

    try {
        auto job = std::async(std::launch::async, [this] {
            InFlightReset reset{check_in_flight_};
            runScheduledCheck();
        });
        std::lock_guard<std::mutex> lock(mutex_);
        scheduled_job_ = std::move(job);
    } catch (const std::system_error& ex) {
        check_in_flight_.store(false);
        reportError(fmt::format("Could not start scheduled check: {}", ex.what()));
    }
}

void UpdateService::runScheduledCheck() {
    const UpdateCheck result = checkForUpdates(*source_);

    CheckListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = on_check_;
    }
    if (listener) {
        listener(result);
    }

    if (!result.update_available || !result.latest) {
        return;
    }
    if (!settings_.settings().auto_install_enabled) {
        spdlog::info("Python {} is available", result.latest->toString());
        return;
    }

    if (download_in_flight_.exchange(true)) {
        reportError("A download is already running");
        return;
    }
    InFlightReset reset{download_in_flight_};

    if (!result.installer_url) {
        reportError(fmt::format("No installer available for Python {}", result.latest->toString()));
        return;
    }

    try {
        const auto installer = fetchInstaller(*result.installer_url, {}, std::nullopt);
        if (!install(installer)) {
            reportError("The installer could not be launched");
        }
    } catch (const std::exception& ex) {
        reportError(ex.what());
    }
}

void UpdateService::reportError(const std::string& message) {
    spdlog::error("{}", message);

    ErrorListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = on_error_;
    }
    if (listener) {
        listener(message);
    }
}

} // namespace pyupdater
