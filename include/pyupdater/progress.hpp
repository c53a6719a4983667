#pragma once

#include <cstdint>
#include <functional>

namespace pyupdater {

struct Progress {
    std::uint64_t downloaded_bytes{0};
    // 0 when the origin did not announce a size
    std::uint64_t total_bytes{0};
};

using ProgressCallback = std::function<void(const Progress&)>;

} // namespace pyupdater
