#pragma once

namespace st {

inline auto is_ascii_alpha(char ch) -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}
inline auto is_ascii_digit(char ch) -> bool {
    return ch >= '0' && ch <= '9';
}
inline auto is_ascii_alnum(char ch) -> bool {
    return is_ascii_alpha(ch) || is_ascii_digit(ch);
}
// Bytes of a UTF-8 sequence are treated as identifier characters.
inline auto is_identifier_ch(char ch) -> bool {
    return is_ascii_alnum(ch) || ch == '_' || static_cast<unsigned char>(ch) >= 0x80;
}

}
