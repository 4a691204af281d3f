#pragma once
#include <ostream>
#include <string>

namespace agentsh {

// User-facing output channel. info/success go to the output stream,
// warn/error to the error stream. Colors are plain ANSI escapes.
// terminal marks an output stream that is an interactive screen.
class Output {
public:
    Output(std::ostream& out, std::ostream& err, bool color = false, bool terminal = false);

    void info(const std::string& line);
    void success(const std::string& line);
    void warn(const std::string& line);
    void error(const std::string& line);

    // 60-column separator
    void rule();

    // Raw text, no newline appended
    void write(const std::string& text);

    void set_color(bool color) { color_ = color; }
    bool color() const { return color_; }
    bool terminal() const { return terminal_; }

private:
    std::string paint(const char* code, const std::string& text) const;

    std::ostream& out_;
    std::ostream& err_;
    bool color_;
    bool terminal_;
};

// True when stdout is a terminal
bool stdout_is_tty();

} // namespace agentsh
