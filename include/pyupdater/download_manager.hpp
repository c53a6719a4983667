#pragma once

#include "download_error.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace pyupdater {

struct DownloadOptions {
    std::size_t chunk_size{1024 * 1024};
    // Bound on connecting, and on how long the transfer may stall.
    std::chrono::seconds timeout{30};
};

class DownloadManager {
public:
    explicit DownloadManager(DownloadOptions options = {});
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Streams `url` into `destination_dir` (the temp directory when empty) and
    // returns the written file. `file_name` defaults to the URL's last path
    // segment. Throws DownloadError; no partial file survives a failure. Fails as
    // cancelled without touching the disk while a cancel request is pending.
    std::filesystem::path download(const std::string& url,
                                   const std::filesystem::path& destination_dir = {},
                                   const ProgressCallback& on_progress = {},
                                   const std::string& file_name = {});

    // Safe to call from any thread; honoured at the next chunk boundary. The
    // request stays pending until reset(), so it also stops a download that
    // has not started yet.
    void cancel() noexcept;
    void reset() noexcept;

    [[nodiscard]] static bool verify(const std::filesystem::path& path,
                                     const std::optional<std::string>& expected_sha256 = std::nullopt);

    void cleanup() noexcept;

    [[nodiscard]] std::optional<std::filesystem::path> downloadPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Last path segment of a URL with any query or fragment removed.
[[nodiscard]] std::string fileNameFromUrl(const std::string& url);

// Lower-case hex SHA-256 of a file's contents, or nothing if it cannot be read.
[[nodiscard]] std::optional<std::string> sha256File(const std::filesystem::path& path);

} // namespace pyupdater
