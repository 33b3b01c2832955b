#pragma once

#include <map>
#include <string>

namespace st::gfx {

struct CompileOptions final {
    // Keep the preprocessor's line markers as a `SourceMap` beside the artifact.
    bool use_sourcemap = true;
    // Passed to the preprocessor as `-D<key>=<value>`, or `-D<key>` when the value is empty.
    std::map<std::string, std::string> defines;
};

}
