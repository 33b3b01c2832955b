#include "wgsl_lexer.hpp"

#include <fmt/format.h>
#include <shadertree/prelude/misc.hpp>

namespace st::ext {

namespace {

auto is_space(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

auto is_exponent(char ch, bool hex) -> bool {
    return hex ? (ch == 'p' || ch == 'P') : (ch == 'e' || ch == 'E');
}

auto closing_of(char ch) -> char {
    switch (ch) {
        case '{': return '}';
        case '(': return ')';
        case '[': return ']';
        default: return '\0';
    }
}

}

auto tokenize_wgsl(std::string_view source) -> Expected<std::vector<WgslToken>, WgslLexError> {
    std::vector<WgslToken> tokens;
    uint32_t line = 1;
    bool spaced = false;
    size_t pos = 0;

    while (pos < source.size()) {
        auto ch = source[pos];

        if (is_space(ch)) {
            if (ch == '\n') { ++line; }
            spaced = true;
            ++pos;
            continue;
        }

        if (source.substr(pos, 2) == "//") {
            while (pos < source.size() && source[pos] != '\n') { ++pos; }
            spaced = true;
            continue;
        }

        if (source.substr(pos, 2) == "/*") {
            auto start_line = line;
            size_t depth = 0;
            while (true) {
                if (pos >= source.size()) {
                    return WgslLexError{"unterminated block comment", start_line};
                }
                if (source.substr(pos, 2) == "/*") {
                    ++depth;
                    pos += 2;
                } else if (source.substr(pos, 2) == "*/") {
                    --depth;
                    pos += 2;
                    if (depth == 0) { break; }
                } else {
                    if (source[pos] == '\n') { ++line; }
                    ++pos;
                }
            }
            spaced = true;
            continue;
        }

        auto start = pos;
        WgslTokenKind kind;
        if (is_ascii_digit(ch) || (ch == '.' && pos + 1 < source.size() && is_ascii_digit(source[pos + 1]))) {
            kind = WgslTokenKind::word;
            auto hex = source.substr(pos, 2) == "0x" || source.substr(pos, 2) == "0X";
            ++pos;
            while (pos < source.size()) {
                auto c = source[pos];
                if (is_identifier_ch(c) || c == '.') {
                    ++pos;
                } else if ((c == '+' || c == '-') && is_exponent(source[pos - 1], hex)) {
                    ++pos;
                } else {
                    break;
                }
            }
        } else if (is_identifier_ch(ch)) {
            kind = WgslTokenKind::word;
            while (pos < source.size() && is_identifier_ch(source[pos])) { ++pos; }
        } else {
            kind = WgslTokenKind::punct;
            ++pos;
        }

        tokens.push_back(WgslToken{
            .kind = kind,
            .text = source.substr(start, pos - start),
            .line = line,
            .spaced = spaced,
        });
        spaced = false;
    }

    return tokens;
}

auto check_brackets(std::vector<WgslToken> const& tokens) -> Expected<void, WgslLexError> {
    std::vector<WgslToken const*> open{};
    for (auto const& token : tokens) {
        if (token.kind != WgslTokenKind::punct) { continue; }
        auto ch = token.text.front();
        if (closing_of(ch) != '\0') {
            open.push_back(&token);
        } else if (ch == '}' || ch == ')' || ch == ']') {
            if (open.empty() || closing_of(open.back()->text.front()) != ch) {
                return WgslLexError{fmt::format("unmatched '{}'", ch), token.line};
            }
            open.pop_back();
        }
    }
    if (!open.empty()) {
        return WgslLexError{fmt::format("unclosed '{}'", open.back()->text.front()), open.back()->line};
    }
    return {};
}

}
