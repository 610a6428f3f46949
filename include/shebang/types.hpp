#pragma once

#include <shebang/result.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shebang {

namespace fs = std::filesystem;

// Only the head of a file is inspected for a shebang line
constexpr size_t MAX_SHEBANG_SCAN = 1024;

/**
 * A parsed shebang line: "#!" followed by an interpreter and its arguments.
 */
struct ShebangLine {
    std::string interpreter;              // e.g. "/usr/bin/env"
    std::vector<std::string> arguments;   // e.g. {"python3", "-u"}
    size_t line_end = 0;                  // Offset of the line terminator (or text size)

    // Canonical form, without line terminator
    std::string to_string() const;
};

/**
 * Byte range of a file to format. Half-open: [start, end).
 */
struct TextRange {
    size_t start = 0;
    size_t end = 0;
};

/**
 * A single-file format request, as issued by a host.
 */
struct FormatRequest {
    fs::path file_path;                 // Used by callers for filetype gating
    std::string file_text;
    std::optional<TextRange> range;     // Whole file when absent
};

// nullopt means "unchanged"
using FormatResult = Result<std::optional<std::string>>;

}  // namespace shebang
