#include "pyupdater/download_manager.hpp"
#include "pyupdater/detail/curl_utils.hpp"
#include "pyupdater/download_task.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <fstream>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace pyupdater {

class DownloadManager::Impl {
public:
    explicit Impl(DownloadOptions options) : options_(options) {
        options_.chunk_size = std::max<std::size_t>(1, options_.chunk_size);
    }

    std::filesystem::path download(const std::string& url,
                                   const std::filesystem::path& destination_dir,
                                   const ProgressCallback& on_progress,
                                   const std::string& file_name) {
        task_.url = url;
        task_.progress = {};
        if (task_.cancelled.load()) {
            spdlog::warn("Download of {} cancelled before it started", url);
            throw DownloadError("Download cancelled", true);
        }

        std::filesystem::path directory = destination_dir;
        std::error_code ec;
        if (directory.empty()) {
            directory = std::filesystem::temp_directory_path(ec);
            if (ec) {
                throw DownloadError("Cannot locate temporary directory: " + ec.message());
            }
        } else {
            std::filesystem::create_directories(directory, ec);
            if (ec) {
                throw DownloadError(fmt::format("Cannot create download directory {}: {}",
                                                directory.string(), ec.message()));
            }
        }
        task_.destination = directory / (file_name.empty() ? fileNameFromUrl(url) : file_name);

        spdlog::info("Downloading {} to {}", url, task_.destination.string());
        try {
            transfer(on_progress);
        } catch (...) {
            removePartial();
            throw;
        }

        spdlog::info("Downloaded {} bytes to {}", task_.progress.downloaded_bytes,
                     task_.destination.string());
        download_path_ = task_.destination;
        return task_.destination;
    }

    void cancel() noexcept { task_.cancelled.store(true); }

    void reset() noexcept { task_.cancelled.store(false); }

    void cleanup() noexcept {
        if (!download_path_) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(*download_path_, ec);
        if (ec) {
            spdlog::warn("Could not remove {}: {}", download_path_->string(), ec.message());
        }
        download_path_.reset();
    }

    [[nodiscard]] std::optional<std::filesystem::path> downloadPath() const { return download_path_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct TransferContext {
        Impl* owner{nullptr};
        CURL* curl{nullptr};
        const ProgressCallback* on_progress{nullptr};
        bool size_checked{false};
        std::string write_error;
        std::exception_ptr callback_error;
    };

    void transfer(const ProgressCallback& on_progress) {
        file_.reset(std::fopen(task_.destination.c_str(), "wb"));
        if (!file_) {
            throw DownloadError("Cannot create destination file " + task_.destination.string());
        }

        detail::CurlHandle curl = detail::makeCurlHandle();
        if (!curl) {
            throw DownloadError("Failed to allocate curl handle");
        }

        buffer_.clear();
        buffer_.reserve(options_.chunk_size);

        TransferContext ctx{this, curl.get(), &on_progress};
        const long timeout = static_cast<long>(options_.timeout.count());
        curl_easy_setopt(curl.get(), CURLOPT_URL, task_.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, timeout);

        const CURLcode res = curl_easy_perform(curl.get());

        if (ctx.callback_error) {
            std::rethrow_exception(ctx.callback_error);
        }
        if (task_.cancelled.load()) {
            spdlog::warn("Download of {} cancelled after {} bytes", task_.url,
                         task_.progress.downloaded_bytes);
            throw DownloadError("Download cancelled", true);
        }
        if (!ctx.write_error.empty()) {
            throw DownloadError(ctx.write_error);
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (res == CURLE_HTTP_RETURNED_ERROR || (code != 0 && (code < 200 || code >= 300))) {
            throw DownloadError(fmt::format("Server returned HTTP {} for {}", code, task_.url));
        }
        if (res != CURLE_OK) {
            throw DownloadError(fmt::format("Download failed: {}", curl_easy_strerror(res)));
        }

        // The tail of the stream is shorter than a full chunk.
        if (!flushChunk(ctx)) {
            if (ctx.callback_error) {
                std::rethrow_exception(ctx.callback_error);
            }
            throw DownloadError(ctx.write_error);
        }
        if (task_.cancelled.load()) {
            throw DownloadError("Download cancelled", true);
        }

        if (std::fclose(file_.release()) != 0) {
            throw DownloadError("Failed to finalize " + task_.destination.string());
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->owner) {
            return 0;
        }

        Impl& self = *ctx->owner;
        const size_t total = size * nmemb;

        if (!ctx->size_checked) {
            curl_off_t length = -1;
            curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
            // -1 when the origin sent no Content-Length
            self.task_.progress.total_bytes = static_cast<std::uint64_t>(std::max<curl_off_t>(0, length));
            ctx->size_checked = true;
        }

        const std::size_t chunk_size = self.options_.chunk_size;
        size_t consumed = 0;
        while (consumed < total) {
            const size_t take = std::min(chunk_size - self.buffer_.size(), total - consumed);
            self.buffer_.insert(self.buffer_.end(), ptr + consumed, ptr + consumed + take);
            consumed += take;

            if (self.buffer_.size() == chunk_size) {
                if (!self.flushChunk(*ctx)) {
                    return 0;
                }
                if (self.task_.cancelled.load()) {
                    return 0;
                }
            }
        }
        return total;
    }

    bool flushChunk(TransferContext& ctx) {
        if (buffer_.empty()) {
            return true;
        }

        const size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), file_.get());
        if (written != buffer_.size()) {
            ctx.write_error = "Failed to write " + task_.destination.string();
            return false;
        }
        buffer_.clear();

        Progress& progress = task_.progress;
        progress.downloaded_bytes += written;
        if (progress.total_bytes != 0 && progress.downloaded_bytes > progress.total_bytes) {
            progress.total_bytes = progress.downloaded_bytes;
        }

        if (ctx.on_progress && *ctx.on_progress) {
            try {
                (*ctx.on_progress)(progress);
            } catch (...) {
                ctx.callback_error = std::current_exception();
                return false;
            }
        }
        return true;
    }

    void removePartial() noexcept {
        file_.reset();
        std::error_code ec;
        std::filesystem::remove(task_.destination, ec);
        if (ec) {
            spdlog::error("Could not remove partial file {}: {}", task_.destination.string(), ec.message());
        }
    }

    DownloadOptions options_;
    DownloadTask task_;
    std::unique_ptr<FILE, FileDeleter> file_{};
    std::vector<char> buffer_;
    std::optional<std::filesystem::path> download_path_;
};

DownloadManager::DownloadManager(DownloadOptions options)
    : impl_(std::make_unique<Impl>(options)) {}

DownloadManager::~DownloadManager() = default;

std::filesystem::path DownloadManager::download(const std::string& url,
                                                const std::filesystem::path& destination_dir,
                                                const ProgressCallback& on_progress,
                                                const std::string& file_name) {
    return impl_->download(url, destination_dir, on_progress, file_name);
}

void DownloadManager::cancel() noexcept { impl_->cancel(); }

void DownloadManager::reset() noexcept { impl_->reset(); }

void DownloadManager::cleanup() noexcept { impl_->cleanup(); }

std::optional<std::filesystem::path> DownloadManager::downloadPath() const { return impl_->downloadPath(); }

bool DownloadManager::verify(const std::filesystem::path& path, const std::optional<std::string>& expected_sha256) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0) {
        return false;
    }

    if (!expected_sha256 || expected_sha256->empty()) {
        return true;
    }

    const auto digest = sha256File(path);
    if (!digest) {
        return false;
    }

    std::string expected = *expected_sha256;
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return *digest == expected;
}

std::string fileNameFromUrl(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    const auto slash = path.find_last_of('/');
    if (slash != std::string::npos) {
        path = path.substr(slash + 1);
    }
    return path.empty() ? std::string{"download.bin"} : path;
}

std::optional<std::string> sha256File(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        spdlog::error("Failed to initialise SHA-256 context");
        return std::nullopt;
    }

    std::vector<char> block(8192);
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), block.data(), static_cast<size_t>(got)) != 1) {
            return std::nullopt;
        }
    }
    if (in.bad()) {
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return std::nullopt;
    }

    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

} // namespace pyupdater
