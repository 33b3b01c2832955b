#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../prelude/option.hpp"

namespace st::gfx {

struct SourceLocation final {
    std::string file;
    uint32_t line = 0;

    auto operator==(SourceLocation const& rhs) const -> bool = default;
};

// Correlates lines of a compiled artifact (1-based) with lines of the files it was built from.
struct SourceMap final {
    auto add_line(std::string_view file, uint32_t source_line) -> void;

    auto lookup(uint32_t generated_line) const -> Option<SourceLocation>;

    auto line_count() const -> size_t { return entries_.size(); }
    auto files() const -> std::vector<std::string> const& { return files_; }

private:
    struct Entry final {
        uint32_t file_index;
        uint32_t line;
    };

    std::vector<std::string> files_;
    std::vector<Entry> entries_;
};

// Removes the preprocessor's `#line N "file"` markers from `preprocessed`. Returns the remaining text
// and the location every remaining line came from. Lines before the first marker belong to
// `input_file`, starting at line 1.
auto split_line_markers(std::string_view preprocessed, std::string_view input_file)
    -> std::pair<std::string, SourceMap>;

}
