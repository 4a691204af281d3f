#include "tokenize.hpp"

namespace agentsh {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

TokenizeResult tokenize(const std::string& line) {
    enum class State { Between, Word, Single, Double };

    TokenizeResult result;
    State state = State::Between;
    std::string current;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        switch (state) {
            case State::Between:
            case State::Word:
                if (is_blank(c)) {
                    if (state == State::Word) {
                        result.tokens.push_back(std::move(current));
                        current.clear();
                        state = State::Between;
                    }
                } else if (c == '\'') {
                    state = State::Single;
                } else if (c == '"') {
                    state = State::Double;
                } else if (c == '\\') {
                    if (i + 1 >= line.size()) {
                        result.tokens.clear();
                        result.error = "No escaped character";
                        return result;
                    }
                    current += line[++i];
                    state = State::Word;
                } else {
                    current += c;
                    state = State::Word;
                }
                break;

            case State::Single:
                if (c == '\'') {
                    state = State::Word;
                } else {
                    current += c;
                }
                break;

            case State::Double:
                if (c == '"') {
                    state = State::Word;
                } else if (c == '\\' && i + 1 < line.size() &&
                           (line[i + 1] == '"' || line[i + 1] == '\\')) {
                    current += line[++i];
                } else {
                    current += c;
                }
                break;
        }
    }

    if (state == State::Single || state == State::Double) {
        result.tokens.clear();
        result.error = "No closing quotation";
        return result;
    }
    // Word is entered on any quote, so "" still yields an empty token
    if (state == State::Word) {
        result.tokens.push_back(std::move(current));
    }
    return result;
}

} // namespace agentsh
