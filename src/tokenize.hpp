#pragma once
#include <string>
#include <vector>

namespace agentsh {

struct TokenizeResult {
    std::vector<std::string> tokens;
    std::string error; // non-empty on failure
    bool ok() const { return error.empty(); }
};

// POSIX shell-style word splitting:
//   - unquoted whitespace separates words
//   - '...' is literal
//   - "..." is literal except for backslash-escaped quote or backslash
//   - an unquoted backslash escapes the next character
// Unterminated quotes and a trailing backslash are errors.
TokenizeResult tokenize(const std::string& line);

} // namespace agentsh
