#include "output.hpp"
#include "util.hpp"
#include <unistd.h>

namespace agentsh {

namespace {

constexpr const char* kGreenBold = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kRedBold = "\033[1;31m";
constexpr const char* kReset = "\033[0m";

} // namespace

Output::Output(std::ostream& out, std::ostream& err, bool color, bool terminal)
    : out_(out), err_(err), color_(color), terminal_(terminal) {}

std::string Output::paint(const char* code, const std::string& text) const {
    if (!color_) return text;
    return std::string(code) + text + kReset;
}

void Output::info(const std::string& line) {
    out_ << line << '\n';
}

void Output::success(const std::string& line) {
    out_ << paint(kGreenBold, line) << '\n';
}

void Output::warn(const std::string& line) {
    out_.flush();
    err_ << paint(kYellow, line) << '\n';
}

void Output::error(const std::string& line) {
    out_.flush();
    err_ << paint(kRedBold, line) << '\n';
}

void Output::rule() {
    out_ << h_bar() << '\n';
}

void Output::write(const std::string& text) {
    out_ << text << std::flush;
}

bool stdout_is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

} // namespace agentsh
