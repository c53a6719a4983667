#include "pyupdater/console_progress.hpp"
#include "pyupdater/detail/curl_utils.hpp"
#include "pyupdater/logging.hpp"
#include "pyupdater/settings.hpp"
#include "pyupdater/update_service.hpp"
#include "pyupdater/version_checker.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onInterrupt(int) { g_interrupted = 1; }

struct CliOptions {
    std::string command;
    std::optional<std::string> download_dir;
    std::optional<std::string> sha256;
    std::optional<std::string> version;
    std::optional<std::string> at;
    std::vector<std::string> args;
    bool quiet{false};
    bool verbose{false};
};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <command> [args]" << std::endl;
    std::cerr << "Commands:\n"
              << "  check                 Compare the installed Python with the latest release\n"
              << "  download              Download the installer\n"
              << "  install               Download the installer and run it\n"
              << "  now                   Run the scheduled check immediately\n"
              << "  schedule              Run scheduled daily checks until interrupted\n"
              << "  next                  Show when the next scheduled check runs\n"
              << "  config [key value]    Show or change a setting\n"
              << "Options:\n"
              << "  -d <directory>        Download directory (default: settings or temp)\n"
              << "  --sha256 <hash>       Expected SHA-256 of the installer\n"
              << "  --version <X.Y.Z>     Version to download instead of the latest\n"
              << "  --at <HH:MM>          Time of day for scheduled checks\n"
              << "  --quiet               Install without installer UI\n"
              << "  -v                    Verbose logging\n"
              << "  -h, --help            Show this message" << std::endl;
}

std::string describe(const std::optional<pyupdater::RuntimeVersion>& version) {
    return version ? "Python " + version->toString() : std::string{"unknown"};
}

void printCheck(const pyupdater::UpdateCheck& result) {
    std::cout << "Installed: " << describe(result.installed) << '\n'
              << "Latest:    " << describe(result.latest) << '\n';
    if (result.update_available) {
        std::cout << "A new version is available";
        if (!result.installer_url) {
            std::cout << " (installer not published yet)";
        }
        std::cout << std::endl;
    } else if (result.installed && result.latest) {
        std::cout << "Up to date" << std::endl;
    } else {
        std::cout << "Could not determine version information" << std::endl;
    }
}

// Waits for a worker, cancelling the download on Ctrl+C.
template <typename T>
T waitInterruptible(std::future<T>& future, pyupdater::UpdateService& service) {
    bool cancel_sent = false;
    while (future.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (g_interrupted && !cancel_sent) {
            service.cancelDownload();
            cancel_sent = true;
        }
    }
    return future.get();
}

std::optional<std::filesystem::path> runDownload(pyupdater::UpdateService& service, const CliOptions& options) {
    std::optional<pyupdater::RuntimeVersion> version;
    if (options.version) {
        version = pyupdater::RuntimeVersion::parse(*options.version);
        if (!version) {
            throw std::runtime_error("Invalid version: " + *options.version);
        }
    } else {
        auto check = service.checkForUpdatesAsync();
        version = waitInterruptible(check, service).latest;
        if (!version) {
            throw std::runtime_error("Could not determine the latest version");
        }
    }

    pyupdater::ConsoleProgress progress(fmt::format("python-{}", version->toString()), std::cout);
    auto download = service.downloadAsync(
        *version, [&progress](const pyupdater::Progress& p) { progress.update(p); }, options.sha256);

    try {
        auto installer = waitInterruptible(download, service);
        if (!installer) {
            progress.finish(false, "no installer published for this version");
            return std::nullopt;
        }
        progress.finish(true);
        std::cout << installer->string() << std::endl;
        return installer;
    } catch (const pyupdater::DownloadError& ex) {
        progress.finish(false, ex.what());
        throw;
    }
}

int runSchedule(pyupdater::UpdateService& service, pyupdater::SettingsStore& store, const CliOptions& options) {
    if (options.at) {
        if (!pyupdater::TimeOfDay::parse(*options.at)) {
            throw std::runtime_error("Invalid time of day: " + *options.at);
        }
        store.setScheduledTime(*options.at);
    }
    store.setAutoUpdate(true);

    service.onCheckCompleted([](const pyupdater::UpdateCheck& result) { printCheck(result); });
    service.scheduler().onNextFiringChanged([](const std::optional<pyupdater::LocalDateTime>& next) {
        if (next) {
            spdlog::info("Next scheduled check: {}", next->toString());
        }
    });
    service.applySchedule();

    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    service.scheduler().stop();
    service.cancelDownload();
    service.waitForScheduledWork();
    return 0;
}

int runConfig(pyupdater::SettingsStore& store, const CliOptions& options) {
    if (options.args.empty()) {
        std::cout << pyupdater::serializeSettings(store.settings()) << std::endl;
        return 0;
    }
    if (options.args.size() != 2) {
        throw std::runtime_error("config expects <key> <value>");
    }

    const std::string& key = options.args[0];
    const std::string& value = options.args[1];
    auto parseBool = [&]() {
        if (value == "true" || value == "1" || value == "on") {
            return true;
        }
        if (value == "false" || value == "0" || value == "off") {
            return false;
        }
        throw std::runtime_error("Expected true or false for " + key);
    };

    pyupdater::AppSettings& settings = store.mutableSettings();
    if (key == "auto_update_enabled") {
        settings.auto_update_enabled = parseBool();
    } else if (key == "auto_install_enabled") {
        settings.auto_install_enabled = parseBool();
    } else if (key == "include_prerelease") {
        settings.include_prerelease = parseBool();
    } else if (key == "scheduled_time") {
        if (!pyupdater::TimeOfDay::parse(value)) {
            throw std::runtime_error("Invalid time of day: " + value);
        }
        settings.scheduled_time = value;
    } else if (key == "schedule_tolerance_minutes") {
        try {
            settings.schedule_tolerance_minutes = std::stoi(value);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid tolerance: " + value);
        }
        if (settings.schedule_tolerance_minutes <= 0) {
            throw std::runtime_error("Tolerance must be positive");
        }
    } else if (key == "download_dir") {
        settings.download_dir = value;
    } else if (key == "interpreter") {
        settings.interpreter = value;
    } else if (key == "log_level") {
        settings.log_level = value;
    } else {
        throw std::runtime_error("Unknown setting: " + key);
    }
    store.save();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        CliOptions options;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];
            auto takeValue = [&]() -> std::string {
                if (arg_index + 1 >= argc) {
                    throw std::runtime_error("Missing value for " + option);
                }
                arg_index += 2;
                return argv[arg_index - 1];
            };

            if (option == "-d") {
                options.download_dir = takeValue();
            } else if (option == "--sha256") {
                options.sha256 = takeValue();
            } else if (option == "--version") {
                options.version = takeValue();
            } else if (option == "--at") {
                options.at = takeValue();
            } else if (option == "--quiet") {
                options.quiet = true;
                ++arg_index;
            } else if (option == "-v") {
                options.verbose = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (arg_index >= argc) {
            printUsage(argv[0]);
            return 1;
        }
        options.command = argv[arg_index++];
        for (; arg_index < argc; ++arg_index) {
            options.args.emplace_back(argv[arg_index]);
        }

        pyupdater::SettingsStore store;
        pyupdater::initLogging(options.verbose ? "debug" : store.settings().log_level, store.directory());
        if (options.command == "config") {
            return runConfig(store, options);
        }

        pyupdater::detail::ensureCurlInitialized();
        std::signal(SIGINT, onInterrupt);
        std::signal(SIGTERM, onInterrupt);

        pyupdater::VersionCheckerOptions checker_options;
        checker_options.interpreter = store.settings().interpreter;

        pyupdater::UpdateServiceOptions service_options;
        service_options.install.silent = options.quiet;
        if (options.download_dir) {
            service_options.download_dir = *options.download_dir;
        }

        pyupdater::UpdateService service(store, std::make_shared<pyupdater::VersionChecker>(checker_options),
                                         service_options);

        if (options.command == "check") {
            auto check = service.checkForUpdatesAsync();
            printCheck(waitInterruptible(check, service));
        } else if (options.command == "download") {
            return runDownload(service, options) ? 0 : 1;
        } else if (options.command == "install") {
            const auto installer = runDownload(service, options);
            if (!installer) {
                return 1;
            }
            const bool launched = service.install(*installer);
            std::cout << (launched ? "Installer finished" : "Installer failed") << std::endl;
            return launched ? 0 : 1;
        } else if (options.command == "now") {
            service.onCheckCompleted([](const pyupdater::UpdateCheck& result) { printCheck(result); });
            service.checkNow();
            auto job = std::async(std::launch::async, [&service] { service.waitForScheduledWork(); });
            waitInterruptible(job, service);
        } else if (options.command == "schedule") {
            return runSchedule(service, store, options);
        } else if (options.command == "next") {
            service.applySchedule();
            const auto next = service.scheduler().nextFiringInstant(pyupdater::LocalDateTime::now());
            std::cout << (next ? next->toString() : std::string{"Scheduled checks are disabled"}) << std::endl;
            service.scheduler().stop();
        } else {
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
