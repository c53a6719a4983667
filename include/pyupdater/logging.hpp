#pragma once

#include <filesystem>
#include <string>

namespace pyupdater {

// Installs the default logger: stderr plus, when `log_dir` is non-empty,
// a rotating pyupdater.log there. Unknown level names mean "info".
void initLogging(const std::string& level, const std::filesystem::path& log_dir = {});

} // namespace pyupdater
