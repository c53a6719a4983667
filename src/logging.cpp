#include "pyupdater/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pyupdater {

namespace {

constexpr std::size_t kMaxLogSize = 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

} // namespace

void initLogging(const std::string& level, const std::filesystem::path& log_dir) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file_error;
    if (!log_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            file_error = ec.message();
        } else {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    (log_dir / "pyupdater.log").string(), kMaxLogSize, kMaxLogFiles));
            } catch (const spdlog::spdlog_ex& ex) {
                file_error = ex.what();
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>("pyupdater", sinks.begin(), sinks.end());
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
    spdlog::set_default_logger(std::move(logger));

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled: {}", file_error);
    }
}

} // namespace pyupdater
