#include "history.hpp"
#include <filesystem>
#include <fstream>

namespace agentsh {

History::History(std::string path) : path_(std::move(path)) {}

bool History::append(const std::string& line) {
    if (path_.empty()) return false;

    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) return false;
    }

    std::string entry = line;
    for (auto& c : entry) {
        if (c == '\n' || c == '\r') c = ' ';
    }

    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) return false;
    out << entry << '\n';
    return static_cast<bool>(out);
}

std::vector<std::string> History::entries() const {
    std::vector<std::string> lines;
    std::ifstream in(path_);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace agentsh
