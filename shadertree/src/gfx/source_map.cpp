#include <shadertree/gfx/source_map.hpp>

#include <algorithm>
#include <charconv>

namespace st::gfx {

namespace {

constexpr std::string_view line_marker = "#line ";

struct LineMarker final {
    uint32_t line;
    std::string_view file;
};

auto parse_line_marker(std::string_view text) -> Option<LineMarker> {
    if (!text.starts_with(line_marker)) { return {}; }
    text.remove_prefix(line_marker.size());

    uint32_t line = 0;
    auto [line_end, ec] = std::from_chars(text.data(), text.data() + text.size(), line);
    if (ec != std::errc{}) { return {}; }
    text.remove_prefix(line_end - text.data());

    auto file_begin = text.find('"');
    auto file_end = text.rfind('"');
    if (file_begin == std::string_view::npos || file_end == file_begin) {
        return LineMarker{line, {}};
    }
    return LineMarker{line, text.substr(file_begin + 1, file_end - file_begin - 1)};
}

}

auto SourceMap::add_line(std::string_view file, uint32_t source_line) -> void {
    auto it = std::find(files_.begin(), files_.end(), file);
    if (it == files_.end()) {
        files_.emplace_back(file);
        it = files_.end() - 1;
    }
    entries_.push_back(Entry{static_cast<uint32_t>(it - files_.begin()), source_line});
}

auto SourceMap::lookup(uint32_t generated_line) const -> Option<SourceLocation> {
    if (generated_line == 0 || generated_line > entries_.size()) { return {}; }
    auto const& entry = entries_[generated_line - 1];
    return SourceLocation{files_[entry.file_index], entry.line};
}

auto split_line_markers(std::string_view preprocessed, std::string_view input_file)
    -> std::pair<std::string, SourceMap> {
    std::string text;
    text.reserve(preprocessed.size());
    SourceMap source_map{};

    std::string current_file{input_file};
    uint32_t current_line = 1;
    size_t pos = 0;
    while (pos < preprocessed.size()) {
        auto line_end = preprocessed.find('\n', pos);
        auto has_newline = line_end != std::string_view::npos;
        auto line = preprocessed.substr(pos, has_newline ? line_end - pos : std::string_view::npos);
        pos = has_newline ? line_end + 1 : preprocessed.size();

        if (auto marker = parse_line_marker(line); marker) {
            current_line = marker.value().line;
            if (!marker.value().file.empty()) {
                current_file = marker.value().file;
            }
            continue;
        }

        text += line;
        if (has_newline) { text += '\n'; }
        source_map.add_line(current_file, current_line);
        ++current_line;
    }

    return {std::move(text), std::move(source_map)};
}

}
