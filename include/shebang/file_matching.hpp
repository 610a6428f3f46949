#pragma once

#include <shebang/types.hpp>

#include <string>
#include <vector>

namespace shebang {

/**
 * Which files the formatter applies to.
 *
 * A path matches when its file name is one of file_names (exact), or its
 * extension is one of file_extensions (case-insensitive, without the dot).
 */
struct FileMatchingInfo {
    std::vector<std::string> file_extensions;
    std::vector<std::string> file_names;

    // Script types known to carry a shebang line
    static FileMatchingInfo defaults();

    bool matches(const fs::path& path) const;
};

}  // namespace shebang
