#include "pyupdater/console_progress.hpp"

#include <ostream>
#include <utility>

#include <fmt/format.h>

namespace pyupdater {

ConsoleProgress::ConsoleProgress(std::string label, std::ostream& out)
    : label_(std::move(label)), out_(out) {
    if (label_.size() > 24) {
        label_ = label_.substr(0, 24);
    }
    if (label_.empty()) {
        label_ = "(unnamed)";
    }
}

void ConsoleProgress::update(const Progress& progress) {
    last_ = progress;
    out_ << "\r\033[K" << formatLine(label_, progress) << std::flush;
    drawn_ = true;
}

void ConsoleProgress::finish(bool ok, const std::string& message) {
    if (!drawn_) {
        out_ << formatLine(label_, last_);
    }
    if (ok) {
        out_ << "  Done";
    } else {
        out_ << "  Failed";
        if (!message.empty()) {
            out_ << ": " << message;
        }
    }
    out_ << std::endl;
}

std::string ConsoleProgress::formatLine(const std::string& label, const Progress& progress) {
    if (progress.total_bytes == 0) {
        return fmt::format("{:<24} {}", label, formatSize(progress.downloaded_bytes));
    }

    const double ratio = static_cast<double>(progress.downloaded_bytes) /
                         static_cast<double>(progress.total_bytes);
    const int percent = static_cast<int>(ratio * 100.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    return fmt::format("{:<24} [{}] {:>3}% ({}/{})",
                       label,
                       bar,
                       percent,
                       formatSize(progress.downloaded_bytes),
                       formatSize(progress.total_bytes));
}

std::string ConsoleProgress::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace pyupdater
