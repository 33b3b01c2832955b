#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "../prelude/option.hpp"

namespace st::rt {

auto read_text_file(std::filesystem::path const& path) -> Option<std::string>;

auto write_text_file(std::filesystem::path const& path, std::string_view data) -> bool;

auto count_lines(std::string_view text) -> size_t;

}
