#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <curl/curl.h>

namespace pyupdater::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

void ensureCurlInitialized();

[[nodiscard]] CurlHandle makeCurlHandle();

// Body of a GET request, or nothing on transport failure or a non-2xx status.
[[nodiscard]] std::optional<std::string> fetchText(const std::string& url, std::chrono::seconds timeout);

// Final status code of a HEAD request (redirects followed), 0 on transport failure.
[[nodiscard]] long probeStatus(const std::string& url, std::chrono::seconds timeout);

} // namespace pyupdater::detail
