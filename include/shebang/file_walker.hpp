#pragma once

#include <shebang/file_matching.hpp>
#include <shebang/plugin.hpp>
#include <shebang/result.hpp>
#include <shebang/types.hpp>
#include <shebang/util/logger.hpp>

#include <string>
#include <vector>

namespace shebang {

/**
 * Expand command-line paths into the files to format.
 *
 * Paths that are not directories are taken as given, without filetype
 * gating. Directories are walked recursively; a regular file found there is
 * kept only if it matches `matching`, or always when `all_files` is set.
 *
 * @return Files in walk order, or IO_ERROR if a directory cannot be walked
 */
Result<std::vector<fs::path>> collect_files(const std::vector<fs::path>& paths,
                                            const FileMatchingInfo& matching,
                                            bool all_files,
                                            Logger* logger = nullptr);

enum class FileOutcome {
    UNCHANGED,          // Nothing to do
    FORMATTED,          // Rewritten in place
    NEEDS_FORMATTING    // Would change; left alone in check mode
};

/**
 * Format one file on disk.
 *
 * The file is rewritten only when its content changes, and never in
 * check mode.
 */
Result<FileOutcome> format_file(const PluginHandler& handler,
                                const fs::path& path,
                                bool check);

// NOT_FOUND if the file does not exist, IO_ERROR if it cannot be read
Result<std::string> read_text_file(const fs::path& path);

/**
 * Replace a file's content through a temporary sibling that is renamed
 * over it. The original is untouched if any step fails. Permissions are
 * carried over from the original.
 */
Result<void> replace_file(const fs::path& path, const std::string& content);

}  // namespace shebang
