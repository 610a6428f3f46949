#pragma once

#include <shebang/types.hpp>

#include <optional>
#include <string>

namespace shebang {

/**
 * Normalizes the shebang line at the top of a script.
 *
 * The first line is rebuilt as "#!" + interpreter + (" " + argument)*,
 * dropping whitespace after "#!", collapsing runs of spaces and tabs between
 * tokens, and trimming trailing whitespace. The line terminator and every
 * following byte are kept verbatim.
 */
class ShebangFormatter {
public:
    /**
     * Parse the first line of text as a shebang.
     *
     * @param text Complete file contents
     * @return Parsed line, or nullopt if the text does not start with a
     *         shebang naming an interpreter within MAX_SHEBANG_SCAN bytes
     */
    static std::optional<ShebangLine> parse(const std::string& text);

    /**
     * Format the shebang line.
     *
     * @param text Complete file contents
     * @return Text with a normalized first line (possibly equal to the input),
     *         or nullopt if there is no shebang line to normalize
     */
    static std::optional<std::string> format_shebang(const std::string& text);

    /**
     * Total variant of format_shebang(): text without a shebang is returned
     * unchanged.
     */
    static std::string format(const std::string& text);
};

}  // namespace shebang
