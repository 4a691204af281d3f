#pragma once
#include <string>
#include <vector>

namespace agentsh {

// Append-only line history kept across sessions, one entry per line
class History {
public:
    explicit History(std::string path);

    // Creates the parent directory on first use. Multi-line input is
    // stored with embedded newlines replaced by spaces.
    bool append(const std::string& line);

    std::vector<std::string> entries() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace agentsh
