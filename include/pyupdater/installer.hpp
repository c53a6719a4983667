#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace pyupdater {

struct InstallOptions {
    bool silent{false};
    bool add_to_path{true};
    bool all_users{false};
};

[[nodiscard]] std::vector<std::string> installerArguments(const InstallOptions& options);

// Runs the installer and waits for it. True only when it exits with status 0.
[[nodiscard]] bool launchInstaller(const std::filesystem::path& installer, const InstallOptions& options = {});

} // namespace pyupdater
