#pragma once
#include <iosfwd>
#include <string>

namespace agentsh {

enum class ReadStatus { Line, Interrupted, Eof };

struct ReadResult {
    ReadStatus status = ReadStatus::Eof;
    std::string line;
};

// Source of interactive input lines (injectable for testing)
class LineReader {
public:
    virtual ~LineReader() = default;
    virtual ReadResult read_line(const std::string& prompt) = 0;
};

// Reads lines from an istream, writing the prompt to an ostream.
// With reopen_after_eof set, end of input is reported once and the stream
// state is reset so the next read waits for more input (a terminal after
// Ctrl+D). Otherwise end of input is final.
class StreamLineReader : public LineReader {
public:
    StreamLineReader(std::istream& in, std::ostream& out, bool reopen_after_eof);

    ReadResult read_line(const std::string& prompt) override;

protected:
    virtual void reset_input();

private:
    std::istream& in_;
    std::ostream& out_;
    bool reopen_after_eof_;
};

// std::cin / std::cout; reopens after EOF when stdin is a terminal
class StdinLineReader : public StreamLineReader {
public:
    StdinLineReader();

protected:
    void reset_input() override;
};

} // namespace agentsh
