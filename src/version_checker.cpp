#include "pyupdater/version_checker.hpp"
#include "pyupdater/detail/curl_utils.hpp"

#include <array>
#include <cstdio>
#include <memory>
#include <regex>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pyupdater {

namespace {

std::optional<RuntimeVersion> searchVersion(const std::string& text, const std::regex& pattern) {
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return std::nullopt;
    }
    return RuntimeVersion::parse(match[1].str() + "." + match[2].str() + "." + match[3].str());
}

struct PipeCloser {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            pclose(fp);
        }
    }
};

} // namespace

UpdateCheck checkForUpdates(VersionSource& source) {
    UpdateCheck result;
    result.installed = source.installedVersion();
    result.latest = source.latestVersion();
    if (result.installed && result.latest) {
        result.update_available = isUpdateAvailable(*result.installed, *result.latest);
    }
    if (result.update_available) {
        result.installer_url = source.installerUrl(*result.latest);
    }
    return result;
}

VersionChecker::VersionChecker(VersionCheckerOptions options) : options_(std::move(options)) {}

std::optional<RuntimeVersion> VersionChecker::installedVersion() {
    const std::string command = options_.interpreter + " --version 2>&1";
    std::unique_ptr<FILE, PipeCloser> pipe{popen(command.c_str(), "r")};
    if (!pipe) {
        spdlog::warn("Could not run '{}'", command);
        return std::nullopt;
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        output += buffer.data();
    }

    auto version = parseInterpreterVersion(output);
    if (!version) {
        spdlog::warn("Unrecognised interpreter version output: {}", output);
    }
    return version;
}

std::optional<RuntimeVersion> VersionChecker::latestVersion() {
    const auto page = detail::fetchText(options_.downloads_page, options_.page_timeout);
    if (!page) {
        return std::nullopt;
    }

    auto version = parseLatestVersion(*page);
    if (version) {
        spdlog::info("Latest published version is {}", version->toString());
    } else {
        spdlog::warn("No release version found on {}", options_.downloads_page);
    }
    return version;
}

std::optional<std::string> VersionChecker::installerUrl(const RuntimeVersion& version) {
    std::string url = installerUrlFor(options_.release_base, version);
    const long status = detail::probeStatus(url, options_.probe_timeout);
    if (status != 200) {
        spdlog::warn("Installer {} is not available (HTTP {})", url, status);
        return std::nullopt;
    }
    return url;
}

std::optional<RuntimeVersion> parseLatestVersion(const std::string& html) {
    static const std::regex pattern{R"(Download Python (\d+)\.(\d+)\.(\d+))"};
    return searchVersion(html, pattern);
}

std::optional<RuntimeVersion> parseInterpreterVersion(const std::string& output) {
    static const std::regex pattern{R"(Python (\d+)\.(\d+)\.(\d+))"};
    return searchVersion(output, pattern);
}

std::string installerUrlFor(const std::string& release_base, const RuntimeVersion& version) {
    std::string base = release_base;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    const std::string text = version.toString();
    return fmt::format("{}/{}/python-{}-amd64.exe", base, text, text);
}

} // namespace pyupdater
