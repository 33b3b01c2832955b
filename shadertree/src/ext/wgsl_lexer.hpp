#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <shadertree/prelude/expected.hpp>

namespace st::ext {

enum class WgslTokenKind : uint8_t {
    word,
    punct,
};

struct WgslToken final {
    WgslTokenKind kind;
    std::string_view text;
    uint32_t line;
    // Whitespace or a comment separated this token from the previous one.
    bool spaced = false;
};

struct WgslLexError final {
    std::string message;
    uint32_t line;
};

// Splits WGSL source into identifiers, numbers and single punctuation characters. Comments,
// including nested block comments, are dropped.
auto tokenize_wgsl(std::string_view source) -> Expected<std::vector<WgslToken>, WgslLexError>;

// Reports the first unmatched or unclosed `{` `(` `[`.
auto check_brackets(std::vector<WgslToken> const& tokens) -> Expected<void, WgslLexError>;

}
