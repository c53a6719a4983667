#include "pyupdater/settings.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace pyupdater {

namespace {

using nlohmann::json;

template <typename T>
void readField(const json& doc, const char* key, T& out) {
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return;
    }

    bool matches = false;
    if constexpr (std::is_same_v<T, bool>) {
        matches = it->is_boolean();
    } else if constexpr (std::is_same_v<T, int>) {
        matches = it->is_number_integer();
    } else {
        matches = it->is_string();
    }

    if (!matches) {
        spdlog::warn("Setting '{}' has the wrong type, keeping default", key);
        return;
    }
    out = it->get<T>();
}

std::filesystem::path envPath(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::filesystem::path{value} : std::filesystem::path{};
}

} // namespace

AppSettings parseSettings(const std::string& text) {
    AppSettings settings;

    const json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        spdlog::warn("Settings file is not a JSON object, using defaults");
        return settings;
    }

    readField(doc, "auto_update_enabled", settings.auto_update_enabled);
    readField(doc, "scheduled_time", settings.scheduled_time);
    readField(doc, "auto_install_enabled", settings.auto_install_enabled);
    readField(doc, "include_prerelease", settings.include_prerelease);
    readField(doc, "minimize_to_tray", settings.minimize_to_tray);
    readField(doc, "start_minimized", settings.start_minimized);
    readField(doc, "run_at_startup", settings.run_at_startup);
    readField(doc, "last_check_date", settings.last_check_date);
    readField(doc, "schedule_tolerance_minutes", settings.schedule_tolerance_minutes);
    readField(doc, "download_dir", settings.download_dir);
    readField(doc, "interpreter", settings.interpreter);
    readField(doc, "log_level", settings.log_level);
    return settings;
}

std::string serializeSettings(const AppSettings& settings) {
    json doc = {
        {"auto_update_enabled", settings.auto_update_enabled},
        {"scheduled_time", settings.scheduled_time},
        {"auto_install_enabled", settings.auto_install_enabled},
        {"include_prerelease", settings.include_prerelease},
        {"minimize_to_tray", settings.minimize_to_tray},
        {"start_minimized", settings.start_minimized},
        {"run_at_startup", settings.run_at_startup},
        {"last_check_date", settings.last_check_date},
        {"schedule_tolerance_minutes", settings.schedule_tolerance_minutes},
        {"download_dir", settings.download_dir},
        {"interpreter", settings.interpreter},
        {"log_level", settings.log_level},
    };
    return doc.dump(2);
}

SettingsStore::SettingsStore() : SettingsStore(defaultDirectory()) {}

SettingsStore::SettingsStore(std::filesystem::path directory) : directory_(std::move(directory)) {
    reload();
}

void SettingsStore::reload() {
    settings_ = AppSettings{};

    std::ifstream in(file());
    if (!in) {
        spdlog::debug("No settings at {}, using defaults", file().string());
        return;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    settings_ = parseSettings(buffer.str());
}

void SettingsStore::save() const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("Cannot create settings directory {}: {}",
                                             directory_.string(), ec.message()));
    }

    std::ofstream out(file(), std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open " + file().string() + " for writing");
    }
    out << serializeSettings(settings_) << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write " + file().string());
    }
}

void SettingsStore::setAutoUpdate(bool enabled) {
    settings_.auto_update_enabled = enabled;
    save();
}

void SettingsStore::setScheduledTime(const std::string& time) {
    settings_.scheduled_time = time;
    save();
}

void SettingsStore::setAutoInstall(bool enabled) {
    settings_.auto_install_enabled = enabled;
    save();
}

void SettingsStore::setIncludePrerelease(bool enabled) {
    settings_.include_prerelease = enabled;
    save();
}

void SettingsStore::setLastCheckDate(const std::string& date) {
    settings_.last_check_date = date;
    save();
}

std::filesystem::path SettingsStore::defaultDirectory() {
    if (auto appdata = envPath("APPDATA"); !appdata.empty()) {
        return appdata / "PythonAutoUpdate";
    }
    if (auto xdg = envPath("XDG_CONFIG_HOME"); !xdg.empty()) {
        return xdg / "pyupdater";
    }
    if (auto home = envPath("HOME"); !home.empty()) {
        return home / ".python_autoupdate";
    }
    return std::filesystem::current_path() / ".python_autoupdate";
}

} // namespace pyupdater
