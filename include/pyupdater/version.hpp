#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace pyupdater {

struct RuntimeVersion {
    int major{0};
    int minor{0};
    int patch{0};

    [[nodiscard]] std::string toString() const;
    // Exactly three dot-separated non-negative integers.
    [[nodiscard]] static std::optional<RuntimeVersion> parse(std::string_view text);
};

bool operator==(const RuntimeVersion& lhs, const RuntimeVersion& rhs);
bool operator!=(const RuntimeVersion& lhs, const RuntimeVersion& rhs);
bool operator<(const RuntimeVersion& lhs, const RuntimeVersion& rhs);
bool operator>(const RuntimeVersion& lhs, const RuntimeVersion& rhs);

[[nodiscard]] inline bool isUpdateAvailable(const RuntimeVersion& installed, const RuntimeVersion& latest) {
    return latest > installed;
}

} // namespace pyupdater
