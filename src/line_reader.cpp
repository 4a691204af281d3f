#include "line_reader.hpp"
#include "interrupt.hpp"
#include <cstdio>
#include <iostream>
#include <unistd.h>

namespace agentsh {

StreamLineReader::StreamLineReader(std::istream& in, std::ostream& out, bool reopen_after_eof)
    : in_(in), out_(out), reopen_after_eof_(reopen_after_eof) {}

void StreamLineReader::reset_input() {
    in_.clear();
}

ReadResult StreamLineReader::read_line(const std::string& prompt) {
    clear_interrupt();
    out_ << prompt << std::flush;

    ReadResult result;
    if (std::getline(in_, result.line)) {
        result.status = ReadStatus::Line;
        return result;
    }

    // Ctrl+C interrupts the blocking read; reset the stream and report it
    if (interrupt_requested()) {
        reset_input();
        clear_interrupt();
        out_ << "\n";
        result.line.clear();
        result.status = ReadStatus::Interrupted;
        return result;
    }

    if (reopen_after_eof_) reset_input();
    out_ << "\n";
    result.line.clear();
    result.status = ReadStatus::Eof;
    return result;
}

StdinLineReader::StdinLineReader()
    : StreamLineReader(std::cin, std::cout, isatty(STDIN_FILENO) != 0) {}

void StdinLineReader::reset_input() {
    std::cin.clear();
    std::clearerr(stdin);
}

} // namespace agentsh
