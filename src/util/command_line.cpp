#include "util/command_line.hpp"

namespace onova {

namespace {

bool NeedsQuoting(std::string_view s) {
    if (s.empty()) return true;
    for (const char c : s) {
        const bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                           (c >= '0' && c <= '9') || c == '/' || c == '.' || c == '_' ||
                           c == '-' || c == '+' || c == ':' || c == '=' || c == ',';
        if (!plain) return true;
    }
    return false;
}

bool IsBlank(char c) { return c == ' ' || c == '\t' || c == '\n'; }

} // namespace

std::string ShellQuote(std::string_view s) {
    if (!NeedsQuoting(s)) return std::string(s);

    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string JoinCommandLine(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out.push_back(' ');
        out += ShellQuote(arg);
    }
    return out;
}

std::expected<std::vector<std::string>, std::string> SplitCommandLine(std::string_view line) {
    enum class State { Blank, Word, Single, Double };

    std::vector<std::string> words;
    std::string cur;
    State state = State::Blank;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        switch (state) {
            case State::Blank:
            case State::Word:
                if (IsBlank(c)) {
                    if (state == State::Word) {
                        words.push_back(std::move(cur));
                        cur.clear();
                    }
                    state = State::Blank;
                } else if (c == '\'') {
                    state = State::Single;
                } else if (c == '"') {
                    state = State::Double;
                } else if (c == '\\') {
                    if (i + 1 >= line.size()) return std::unexpected("trailing backslash");
                    // A backslash-newline pair is a line continuation.
                    if (line[i + 1] != '\n') cur.push_back(line[i + 1]);
                    ++i;
                    state = State::Word;
                } else {
                    cur.push_back(c);
                    state = State::Word;
                }
                break;

            case State::Single:
                if (c == '\'') {
                    state = State::Word;
                } else {
                    cur.push_back(c);
                }
                break;

            case State::Double:
                if (c == '"') {
                    state = State::Word;
                } else if (c == '\\' && i + 1 < line.size() &&
                           (line[i + 1] == '"' || line[i + 1] == '\\' || line[i + 1] == '$' ||
                            line[i + 1] == '`')) {
                    cur.push_back(line[++i]);
                } else {
                    cur.push_back(c);
                }
                break;
        }
    }

    if (state == State::Single || state == State::Double) {
        return std::unexpected("unterminated quote");
    }
    if (state == State::Word) {
        words.push_back(std::move(cur));
    }
    return words;
}

} // namespace onova
