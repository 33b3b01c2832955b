#include <shadertree/codec/mangler.hpp>

#include <charconv>

#include <shadertree/prelude/misc.hpp>

namespace st::codec {

namespace {

constexpr char hex_digits[] = "0123456789abcdef";

auto escape_segment(std::string_view segment) -> std::string {
    std::string escaped;
    escaped.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); i++) {
        auto ch = segment[i];
        if (ch == '_') {
            escaped += "__";
        } else if (is_ascii_alpha(ch) || (is_ascii_digit(ch) && i != 0)) {
            escaped += ch;
        } else {
            auto byte = static_cast<unsigned char>(ch);
            escaped += '_';
            escaped += hex_digits[byte >> 4];
            escaped += hex_digits[byte & 0xf];
        }
    }
    return escaped;
}

auto hex_value(char ch) -> int {
    if (ch >= '0' && ch <= '9') { return ch - '0'; }
    if (ch >= 'a' && ch <= 'f') { return ch - 'a' + 10; }
    return -1;
}

auto unescape_segment(std::string_view escaped) -> Option<std::string> {
    std::string segment;
    segment.reserve(escaped.size());
    for (size_t i = 0; i < escaped.size(); i++) {
        auto ch = escaped[i];
        if (is_ascii_alnum(ch)) {
            segment += ch;
            continue;
        }
        if (ch != '_' || i + 1 >= escaped.size()) { return {}; }
        if (escaped[i + 1] == '_') {
            segment += '_';
            i += 1;
            continue;
        }
        if (i + 2 >= escaped.size()) { return {}; }
        auto hi = hex_value(escaped[i + 1]);
        auto lo = hex_value(escaped[i + 2]);
        if (hi < 0 || lo < 0) { return {}; }
        segment += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return segment;
}

auto append_segment(std::string& mangled, std::string_view segment) -> void {
    auto escaped = escape_segment(segment);
    mangled += std::to_string(escaped.size());
    mangled += escaped;
}

}

auto mangle(ModulePath const& path, std::string_view name) -> std::string {
    std::string mangled{
        path.origin == PathOrigin::absolute ? absolute_mangle_prefix : relative_mangle_prefix
    };
    for (auto const& component : path.components) {
        append_segment(mangled, component);
    }
    append_segment(mangled, name);
    return mangled;
}

auto unmangle(std::string_view mangled) -> Option<std::pair<ModulePath, std::string>> {
    auto const original = mangled;

    PathOrigin origin;
    if (mangled.starts_with(absolute_mangle_prefix)) {
        origin = PathOrigin::absolute;
        mangled.remove_prefix(absolute_mangle_prefix.size());
    } else if (mangled.starts_with(relative_mangle_prefix)) {
        origin = PathOrigin::package_relative;
        mangled.remove_prefix(relative_mangle_prefix.size());
    } else {
        return {};
    }

    std::vector<std::string> segments;
    while (!mangled.empty()) {
        size_t length = 0;
        auto [length_end, ec] = std::from_chars(mangled.data(), mangled.data() + mangled.size(), length);
        if (ec != std::errc{} || length == 0) { return {}; }
        mangled.remove_prefix(length_end - mangled.data());
        if (length > mangled.size()) { return {}; }

        auto segment = unescape_segment(mangled.substr(0, length));
        if (!segment || segment.value().empty()) { return {}; }
        segments.push_back(std::move(segment).value());
        mangled.remove_prefix(length);
    }
    if (segments.empty()) { return {}; }

    auto name = std::move(segments.back());
    segments.pop_back();
    ModulePath path{origin, std::move(segments)};

    // Rejects inputs that decode but are spelled differently from what `mangle` writes,
    // e.g. leading zeros in a length or an escaped letter.
    if (mangle(path, name) != original) { return {}; }
    return std::make_pair(std::move(path), std::move(name));
}

auto unmangle_or_root(std::string_view mangled) -> std::pair<ModulePath, std::string> {
    if (auto result = unmangle(mangled); result) {
        return std::move(result).value();
    }
    return {ModulePath::root(), std::string{mangled}};
}

}
