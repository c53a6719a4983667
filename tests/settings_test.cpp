#include "pyupdater/settings.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace pyupdater {
namespace {

using test::TempDir;

TEST(SettingsTest, MissingFileGivesDefaults) {
    TempDir dir;
    SettingsStore store(dir.path());

    const AppSettings& s = store.settings();
    EXPECT_FALSE(s.auto_update_enabled);
    EXPECT_EQ(s.scheduled_time, "09:00");
    EXPECT_FALSE(s.auto_install_enabled);
    EXPECT_TRUE(s.minimize_to_tray);
    EXPECT_EQ(s.last_check_date, "");
    EXPECT_EQ(s.schedule_tolerance_minutes, 2);
    EXPECT_EQ(s.interpreter, "python3");
}

TEST(SettingsTest, SettersPersistAcrossInstances) {
    TempDir dir;
    {
        SettingsStore store(dir.path());
        store.setAutoUpdate(true);
        store.setScheduledTime("18:30");
        store.setAutoInstall(true);
        store.setIncludePrerelease(true);
        store.setLastCheckDate("2024-05-14");
    }

    SettingsStore reopened(dir.path());
    const AppSettings& s = reopened.settings();
    EXPECT_TRUE(s.auto_update_enabled);
    EXPECT_EQ(s.scheduled_time, "18:30");
    EXPECT_TRUE(s.auto_install_enabled);
    EXPECT_TRUE(s.include_prerelease);
    EXPECT_EQ(s.last_check_date, "2024-05-14");
}

TEST(SettingsTest, CorruptFileFallsBackToDefaults) {
    TempDir dir;
    test::writeFile(dir / SettingsStore::kFileName, "{ \"auto_update_enabled\": tru");

    SettingsStore store(dir.path());
    EXPECT_FALSE(store.settings().auto_update_enabled);
    EXPECT_EQ(store.settings().scheduled_time, "09:00");
}

TEST(SettingsTest, NonObjectDocumentFallsBackToDefaults) {
    const AppSettings s = parseSettings("[1, 2, 3]");
    EXPECT_EQ(s.scheduled_time, "09:00");
}

TEST(SettingsTest, MistypedFieldKeepsItsDefaultOnly) {
    const AppSettings s = parseSettings(R"({
        "auto_update_enabled": "yes",
        "scheduled_time": 930,
        "auto_install_enabled": true,
        "last_check_date": "2024-05-14",
        "unknown_key": 1
    })");

    EXPECT_FALSE(s.auto_update_enabled);
    EXPECT_EQ(s.scheduled_time, "09:00");
    EXPECT_TRUE(s.auto_install_enabled);
    EXPECT_EQ(s.last_check_date, "2024-05-14");
}

TEST(SettingsTest, SerializedFormIsFlatJson) {
    AppSettings settings;
    settings.scheduled_time = "07:15";
    settings.schedule_tolerance_minutes = 5;

    const std::string text = serializeSettings(settings);
    EXPECT_NE(text.find("\"scheduled_time\": \"07:15\""), std::string::npos);

    const AppSettings parsed = parseSettings(text);
    EXPECT_EQ(parsed.scheduled_time, "07:15");
    EXPECT_EQ(parsed.schedule_tolerance_minutes, 5);
}

std::optional<std::string> envValue(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::optional<std::string>{value} : std::nullopt;
}

void restoreEnv(const char* name, const std::optional<std::string>& value) {
    if (value) {
        ::setenv(name, value->c_str(), 1);
    } else {
        ::unsetenv(name);
    }
}

TEST(SettingsTest, DefaultDirectoryFollowsEnvironment) {
    const auto saved_appdata = envValue("APPDATA");
    const auto saved_xdg = envValue("XDG_CONFIG_HOME");

    ::setenv("APPDATA", "/tmp/appdata", 1);
    EXPECT_EQ(SettingsStore::defaultDirectory(), std::filesystem::path{"/tmp/appdata/PythonAutoUpdate"});

    ::unsetenv("APPDATA");
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(SettingsStore::defaultDirectory(), std::filesystem::path{"/tmp/xdg/pyupdater"});

    restoreEnv("APPDATA", saved_appdata);
    restoreEnv("XDG_CONFIG_HOME", saved_xdg);
}

TEST(SettingsTest, SaveFailsLoudly) {
    TempDir dir;
    const auto blocker = dir / "not-a-dir";
    test::writeFile(blocker, "x");

    SettingsStore store(blocker / "nested");
    EXPECT_THROW(store.save(), std::runtime_error);
}

} // namespace
} // namespace pyupdater
