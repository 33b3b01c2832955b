#include <shadertree/runtime/text_file.hpp>

#include <fstream>
#include <iterator>

namespace st::rt {

auto read_text_file(std::filesystem::path const& path) -> Option<std::string> {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) { return {}; }
    std::string data{std::istreambuf_iterator<char>{fin}, std::istreambuf_iterator<char>{}};
    if (fin.bad()) { return {}; }
    return data;
}

auto write_text_file(std::filesystem::path const& path, std::string_view data) -> bool {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout) { return false; }
    fout.write(data.data(), data.size());
    return static_cast<bool>(fout);
}

auto count_lines(std::string_view text) -> size_t {
    if (text.empty()) { return 0; }
    size_t lines = 0;
    for (auto ch : text) {
        if (ch == '\n') { ++lines; }
    }
    // last line without a trailing newline
    if (text.back() != '\n') { ++lines; }
    return lines;
}

}
