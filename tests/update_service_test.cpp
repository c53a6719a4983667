#include "pyupdater/update_service.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

namespace pyupdater {
namespace {

using namespace std::chrono_literals;
using test::TempDir;

class FakeSource : public VersionSource {
public:
    std::optional<RuntimeVersion> installedVersion() override { return installed; }
    std::optional<RuntimeVersion> latestVersion() override {
        std::this_thread::sleep_for(lookup_delay);
        return latest;
    }
    std::optional<std::string> installerUrl(const RuntimeVersion&) override {
        std::this_thread::sleep_for(lookup_delay);
        return installer_url;
    }

    std::optional<RuntimeVersion> installed{RuntimeVersion{3, 11, 0}};
    std::optional<RuntimeVersion> latest{RuntimeVersion{3, 12, 1}};
    std::optional<std::string> installer_url;
    // Simulates a slow origin for the remote lookups.
    std::chrono::milliseconds lookup_delay{0};
};

class UpdateServiceTest : public ::testing::Test {
protected:
    UpdateServiceTest() : store_(config_dir_.path()), source_(std::make_shared<FakeSource>()) {}

    std::unique_ptr<UpdateService> makeService(std::size_t chunk_size = 1024 * 1024) {
        UpdateServiceOptions options;
        options.download.chunk_size = chunk_size;
        options.schedule.poll_interval = 0ms;
        options.download_dir = download_dir_.path();
        return std::make_unique<UpdateService>(store_, source_, options);
    }

    void publishInstaller(const std::string& content) {
        const auto path = origin_dir_ / "python-3.12.1-amd64.exe";
        test::writeFile(path, content);
        source_->installer_url = test::fileUrl(path);
    }

    TempDir config_dir_;
    TempDir origin_dir_;
    TempDir download_dir_;
    SettingsStore store_;
    std::shared_ptr<FakeSource> source_;
};

TEST_F(UpdateServiceTest, CheckRunsOnWorkerAndNotifies) {
    publishInstaller("installer");
    auto service = makeService();

    std::atomic<int> notified{0};
    service->onCheckCompleted([&](const UpdateCheck&) { ++notified; });

    const UpdateCheck result = service->checkForUpdatesAsync().get();
    EXPECT_TRUE(result.update_available);
    EXPECT_EQ(result.latest, (RuntimeVersion{3, 12, 1}));
    EXPECT_EQ(result.installer_url, source_->installer_url);
    EXPECT_EQ(notified.load(), 1);
}

TEST_F(UpdateServiceTest, DownloadsIntoConfiguredDirectory) {
    const std::string payload = test::makePayload(70000);
    publishInstaller(payload);
    auto service = makeService(16 * 1024);

    std::uint64_t last = 0;
    const auto installer =
        service->downloadAsync({3, 12, 1}, [&](const Progress& p) { last = p.downloaded_bytes; }).get();

    ASSERT_TRUE(installer.has_value());
    EXPECT_EQ(installer->parent_path(), download_dir_.path());
    EXPECT_EQ(test::readFile(*installer), payload);
    EXPECT_EQ(last, payload.size());
}

TEST_F(UpdateServiceTest, DownloadWithoutPublishedInstallerIsEmpty) {
    auto service = makeService();
    EXPECT_FALSE(service->downloadAsync({3, 12, 1}).get().has_value());
}

TEST_F(UpdateServiceTest, HashMismatchDiscardsDownload) {
    publishInstaller("abc");
    auto service = makeService();

    auto future = service->downloadAsync({3, 12, 1}, {}, std::string(64, '0'));
    EXPECT_THROW(future.get(), DownloadError);
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "python-3.12.1-amd64.exe"));
}

TEST_F(UpdateServiceTest, RejectsSecondConcurrentDownloadAndCancels) {
    publishInstaller(test::makePayload(256 * 1024));
    auto service = makeService(4096);

    std::promise<void> started;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    bool first = true;

    auto download = service->downloadAsync({3, 12, 1}, [&](const Progress&) {
        if (first) {
            first = false;
            started.set_value();
            release_future.wait();
        }
    });

    started.get_future().wait();
    EXPECT_THROW((void)service->downloadAsync({3, 12, 1}), std::runtime_error);

    service->cancelDownload();
    release.set_value();

    try {
        (void)download.get();
        FAIL() << "download should have been cancelled";
    } catch (const DownloadError& ex) {
        EXPECT_TRUE(ex.cancelled());
    }
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "python-3.12.1-amd64.exe"));

    // The slot is free again.
    EXPECT_TRUE(service->downloadAsync({3, 12, 1}).get().has_value());
}

TEST_F(UpdateServiceTest, CancelWhileResolvingInstallerStopsDownload) {
    publishInstaller(test::makePayload(256 * 1024));
    source_->lookup_delay = 300ms;
    auto service = makeService(4096);

    auto download = service->downloadAsync({3, 12, 1});
    std::this_thread::sleep_for(50ms);
    service->cancelDownload();

    try {
        (void)download.get();
        FAIL() << "download should have been cancelled";
    } catch (const DownloadError& ex) {
        EXPECT_TRUE(ex.cancelled());
    }
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "python-3.12.1-amd64.exe"));
}

TEST_F(UpdateServiceTest, CancelDuringScheduledCheckSkipsInstall) {
    const auto marker = download_dir_ / "installed.txt";
    publishInstaller("#!/bin/sh\ntouch '" + marker.string() + "'\n");
    source_->lookup_delay = 300ms;
    store_.setAutoInstall(true);
    auto service = makeService();

    std::promise<std::string> error;
    service->onError([&](const std::string& message) { error.set_value(message); });

    service->checkNow();
    std::this_thread::sleep_for(50ms);
    service->cancelDownload();
    service->waitForScheduledWork();

    auto reported = error.get_future();
    ASSERT_EQ(reported.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(reported.get(), "Download cancelled");
    EXPECT_FALSE(std::filesystem::exists(marker));
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "python-3.12.1-amd64.exe"));
}

TEST_F(UpdateServiceTest, CheckNowRecordsTodayAndRunsCheck) {
    auto service = makeService();

    std::atomic<int> checks{0};
    service->onCheckCompleted([&](const UpdateCheck&) { ++checks; });

    service->checkNow();
    service->waitForScheduledWork();

    const std::string today = LocalDateTime::now().date.toIsoString();
    EXPECT_EQ(checks.load(), 1);
    EXPECT_EQ(store_.settings().last_check_date, today);
    EXPECT_EQ(SettingsStore(config_dir_.path()).settings().last_check_date, today);
    EXPECT_EQ(service->scheduler().lastFiredDate(), LocalDateTime::now().date);
}

TEST_F(UpdateServiceTest, ScheduledCheckInstallsWhenAutoInstallEnabled) {
    const auto marker = download_dir_ / "installed.txt";
    publishInstaller("#!/bin/sh\ntouch '" + marker.string() + "'\n");
    store_.setAutoInstall(true);
    auto service = makeService();

    std::promise<bool> finished;
    service->onInstallFinished([&](const std::filesystem::path&, bool launched) { finished.set_value(launched); });

    service->checkNow();
    service->waitForScheduledWork();

    auto outcome = finished.get_future();
    ASSERT_EQ(outcome.wait_for(0s), std::future_status::ready);
    EXPECT_TRUE(outcome.get());
    EXPECT_TRUE(std::filesystem::exists(marker));
}

TEST_F(UpdateServiceTest, ScheduledCheckReportsMissingInstaller) {
    store_.setAutoInstall(true);
    auto service = makeService();

    std::atomic<int> errors{0};
    service->onError([&](const std::string&) { ++errors; });

    service->checkNow();
    service->waitForScheduledWork();
    EXPECT_EQ(errors.load(), 1);
}

TEST_F(UpdateServiceTest, ApplyScheduleLoadsPersistedState) {
    store_.mutableSettings().auto_update_enabled = true;
    store_.mutableSettings().scheduled_time = "06:45";
    store_.mutableSettings().schedule_tolerance_minutes = 5;
    store_.mutableSettings().last_check_date = "2024-05-14";
    auto service = makeService();

    service->applySchedule();
    ScheduleGate& gate = service->scheduler();
    EXPECT_TRUE(gate.isEnabled());
    EXPECT_EQ(gate.targetTime(), (TimeOfDay{6, 45}));
    EXPECT_EQ(gate.tolerance(), 5min);
    EXPECT_EQ(gate.lastFiredDate(), (Date{2024, 5, 14}));

    store_.mutableSettings().auto_update_enabled = false;
    service->applySchedule();
    EXPECT_FALSE(gate.isEnabled());
}

} // namespace
} // namespace pyupdater
