#include "pyupdater/version.hpp"

#include <charconv>
#include <tuple>

#include <fmt/format.h>

namespace pyupdater {

namespace {

std::optional<int> parseComponent(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    int value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string RuntimeVersion::toString() const {
    return fmt::format("{}.{}.{}", major, minor, patch);
}

std::optional<RuntimeVersion> RuntimeVersion::parse(std::string_view text) {
    const auto first = text.find('.');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const auto second = text.find('.', first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }

    const auto major = parseComponent(text.substr(0, first));
    const auto minor = parseComponent(text.substr(first + 1, second - first - 1));
    const auto patch = parseComponent(text.substr(second + 1));
    if (!major || !minor || !patch) {
        return std::nullopt;
    }
    return RuntimeVersion{*major, *minor, *patch};
}

bool operator==(const RuntimeVersion& lhs, const RuntimeVersion& rhs) {
    return std::tie(lhs.major, lhs.minor, lhs.patch) == std::tie(rhs.major, rhs.minor, rhs.patch);
}

bool operator!=(const RuntimeVersion& lhs, const RuntimeVersion& rhs) { return !(lhs == rhs); }

bool operator<(const RuntimeVersion& lhs, const RuntimeVersion& rhs) {
    return std::tie(lhs.major, lhs.minor, lhs.patch) < std::tie(rhs.major, rhs.minor, rhs.patch);
}

bool operator>(const RuntimeVersion& lhs, const RuntimeVersion& rhs) { return rhs < lhs; }

} // namespace pyupdater
