#pragma once

#include "progress.hpp"

#include <atomic>
#include <filesystem>
#include <string>

namespace pyupdater {

// State of a single transfer. Written only by the thread running the
// transfer, except for `cancelled`, which any thread may set.
struct DownloadTask {
    std::string url;
    std::filesystem::path destination;
    Progress progress;
    std::atomic<bool> cancelled{false};
};

} // namespace pyupdater
