#pragma once

#include <filesystem>
#include <string>

namespace pyupdater {

struct AppSettings {
    bool auto_update_enabled{false};
    std::string scheduled_time{"09:00"};
    bool auto_install_enabled{false};
    bool include_prerelease{false};

    bool minimize_to_tray{true};
    bool start_minimized{false};
    bool run_at_startup{false};

    // YYYY-MM-DD of the last check, empty if none ran yet
    std::string last_check_date;

    int schedule_tolerance_minutes{2};
    // Empty means the system temporary directory.
    std::string download_dir;
    std::string interpreter{"python3"};
    std::string log_level{"info"};
};

// Reads and writes settings.json. Loading never fails: anything missing or
// unreadable keeps its default. Saving throws std::runtime_error.
class SettingsStore {
public:
    // Uses defaultDirectory().
    SettingsStore();
    explicit SettingsStore(std::filesystem::path directory);

    [[nodiscard]] const AppSettings& settings() const { return settings_; }
    [[nodiscard]] AppSettings& mutableSettings() { return settings_; }
    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }
    [[nodiscard]] std::filesystem::path file() const { return directory_ / kFileName; }

    void reload();
    void save() const;

    void setAutoUpdate(bool enabled);
    void setScheduledTime(const std::string& time);
    void setAutoInstall(bool enabled);
    void setIncludePrerelease(bool enabled);
    void setLastCheckDate(const std::string& date);

    // $APPDATA/PythonAutoUpdate, $XDG_CONFIG_HOME/pyupdater or ~/.python_autoupdate.
    [[nodiscard]] static std::filesystem::path defaultDirectory();

    static constexpr const char* kFileName = "settings.json";

private:
    std::filesystem::path directory_;
    AppSettings settings_;
};

[[nodiscard]] AppSettings parseSettings(const std::string& text);
[[nodiscard]] std::string serializeSettings(const AppSettings& settings);

} // namespace pyupdater
