#pragma once

#include "progress.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

namespace pyupdater {

// Single-line progress bar redrawn in place on a terminal.
class ConsoleProgress {
public:
    explicit ConsoleProgress(std::string label, std::ostream& out);

    void update(const Progress& progress);
    void finish(bool ok, const std::string& message = {});

    static std::string formatLine(const std::string& label, const Progress& progress);
    static std::string formatSize(std::uint64_t bytes);

private:
    std::string label_;
    std::ostream& out_;
    Progress last_;
    bool drawn_{false};
};

} // namespace pyupdater
