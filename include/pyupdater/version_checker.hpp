#pragma once

#include "version.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace pyupdater {

// Where versions and installers come from. Every lookup reports an
// unavailable answer as an empty optional.
class VersionSource {
public:
    virtual ~VersionSource() = default;

    [[nodiscard]] virtual std::optional<RuntimeVersion> installedVersion() = 0;
    [[nodiscard]] virtual std::optional<RuntimeVersion> latestVersion() = 0;
    [[nodiscard]] virtual std::optional<std::string> installerUrl(const RuntimeVersion& version) = 0;
};

using VersionSourcePtr = std::shared_ptr<VersionSource>;

struct UpdateCheck {
    std::optional<RuntimeVersion> installed;
    std::optional<RuntimeVersion> latest;
    bool update_available{false};
    // Resolved only when an update is available.
    std::optional<std::string> installer_url;
};

[[nodiscard]] UpdateCheck checkForUpdates(VersionSource& source);

struct VersionCheckerOptions {
    std::string downloads_page{"https://www.python.org/downloads/"};
    std::string release_base{"https://www.python.org/ftp/python"};
    std::string interpreter{"python3"};
    std::chrono::seconds page_timeout{30};
    std::chrono::seconds probe_timeout{10};
};

// Queries python.org and the local interpreter.
class VersionChecker final : public VersionSource {
public:
    explicit VersionChecker(VersionCheckerOptions options = {});

    [[nodiscard]] std::optional<RuntimeVersion> installedVersion() override;
    [[nodiscard]] std::optional<RuntimeVersion> latestVersion() override;
    [[nodiscard]] std::optional<std::string> installerUrl(const RuntimeVersion& version) override;

private:
    VersionCheckerOptions options_;
};

// First "Download Python X.Y.Z" on the downloads page.
[[nodiscard]] std::optional<RuntimeVersion> parseLatestVersion(const std::string& html);

// Output of `python --version`, e.g. "Python 3.12.1".
[[nodiscard]] std::optional<RuntimeVersion> parseInterpreterVersion(const std::string& output);

// <base>/X.Y.Z/python-X.Y.Z-amd64.exe
[[nodiscard]] std::string installerUrlFor(const std::string& release_base, const RuntimeVersion& version);

} // namespace pyupdater
