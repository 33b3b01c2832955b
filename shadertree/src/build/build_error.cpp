#include <shadertree/build/build_error.hpp>

#include <fmt/format.h>
#include <magic_enum.hpp>

namespace st::build {

auto BuildError::io(std::filesystem::path path, std::error_code const& ec) -> BuildError {
    return io(std::move(path), ec.message());
}

auto BuildError::io(std::filesystem::path path, std::string message) -> BuildError {
    return BuildError{
        .kind = BuildErrorKind::io,
        .message = std::move(message),
        .path = std::move(path),
    };
}

auto BuildError::invalid_path(std::filesystem::path path, std::string message) -> BuildError {
    return BuildError{
        .kind = BuildErrorKind::path,
        .message = std::move(message),
        .path = std::move(path),
    };
}

auto BuildError::compile(std::filesystem::path path, std::string message) -> BuildError {
    return BuildError{
        .kind = BuildErrorKind::compile,
        .message = std::move(message),
        .path = std::move(path),
    };
}

auto BuildError::extension(std::string_view extension_name, LifecycleStage stage, std::string message) -> BuildError {
    return BuildError{
        .kind = BuildErrorKind::extension,
        .message = std::move(message),
        .path = {},
        .extension_name = std::string{extension_name},
        .stage = stage,
    };
}

auto BuildError::to_string() const -> std::string {
    switch (kind) {
        case BuildErrorKind::io:
            return fmt::format("I/O error at '{}': {}", path.generic_string(), message);
        case BuildErrorKind::path:
            return fmt::format("invalid path '{}': {}", path.generic_string(), message);
        case BuildErrorKind::compile:
            return fmt::format("failed to compile '{}': {}", path.generic_string(), message);
        case BuildErrorKind::extension:
            return fmt::format(
                "extension '{}' failed in {}: {}", extension_name, build::to_string(stage), message
            );
    }
    return message;
}

auto to_string(LifecycleStage stage) -> std::string_view {
    return magic_enum::enum_name(stage);
}

}
