#include "pyupdater/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace pyupdater::detail {

namespace {

constexpr const char* kUserAgent = "pyupdater/1.0";

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    if (!out) {
        return 0;
    }
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (curl) {
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    }
    return curl;
}

std::optional<std::string> fetchText(const std::string& url, std::chrono::seconds timeout) {
    CurlHandle curl = makeCurlHandle();
    if (!curl) {
        spdlog::error("Failed to allocate curl handle");
        return std::nullopt;
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &appendToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        spdlog::warn("GET {} failed: {}", url, curl_easy_strerror(res));
        return std::nullopt;
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (code < 200 || code >= 300) {
        spdlog::warn("GET {} returned HTTP {}", url, code);
        return std::nullopt;
    }
    return body;
}

long probeStatus(const std::string& url, std::chrono::seconds timeout) {
    CurlHandle curl = makeCurlHandle();
    if (!curl) {
        spdlog::error("Failed to allocate curl handle");
        return 0;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        spdlog::warn("HEAD {} failed: {}", url, curl_easy_strerror(res));
        return 0;
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    return code;
}

} // namespace pyupdater::detail
