#include "pyupdater/installer.hpp"

#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace pyupdater {

std::vector<std::string> installerArguments(const InstallOptions& options) {
    std::vector<std::string> args;
    args.emplace_back(options.silent ? "/quiet" : "/passive");
    if (options.add_to_path) {
        args.emplace_back("PrependPath=1");
    }
    args.emplace_back(options.all_users ? "InstallAllUsers=1" : "InstallAllUsers=0");
    args.emplace_back("Include_test=0");
    args.emplace_back("Include_doc=0");
    args.emplace_back("Include_launcher=1");
    args.emplace_back("InstallLauncherAllUsers=1");
    return args;
}

bool launchInstaller(const std::filesystem::path& installer, const InstallOptions& options) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(installer, ec)) {
        spdlog::error("Installer not found: {}", installer.string());
        return false;
    }

    // Freshly downloaded files are not executable.
    std::filesystem::permissions(installer, std::filesystem::perms::owner_exec,
                                 std::filesystem::perm_options::add, ec);
    if (ec) {
        spdlog::warn("Could not mark {} executable: {}", installer.string(), ec.message());
    }

    std::vector<std::string> args = installerArguments(options);
    args.insert(args.begin(), installer.string());

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    spdlog::info("Launching installer {}", installer.string());
    pid_t pid = 0;
    const int rc = posix_spawn(&pid, args.front().c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        spdlog::error("Failed to start installer: {}", std::strerror(rc));
        return false;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            spdlog::error("waitpid() failed: {}", std::strerror(errno));
            return false;
        }
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        spdlog::error("Installer exited abnormally (status {})", status);
        return false;
    }
    spdlog::info("Installer finished");
    return true;
}

} // namespace pyupdater
