#pragma once

#include <stdexcept>
#include <string>

namespace pyupdater {

class DownloadError : public std::runtime_error {
public:
    explicit DownloadError(const std::string& message, bool cancelled = false)
        : std::runtime_error(message), cancelled_(cancelled) {}

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }

private:
    bool cancelled_;
};

} // namespace pyupdater
