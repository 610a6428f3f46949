#pragma once

namespace shebang::cli {

// Standard exit codes for CLI commands
// Named with SHEBANG_ prefix to avoid conflict with system macros
constexpr int SHEBANG_EXIT_SUCCESS = 0;
constexpr int SHEBANG_EXIT_CHANGED = 1;      // --check found unformatted files
constexpr int SHEBANG_EXIT_USER_ERROR = 2;   // Invalid arguments, usage errors
constexpr int SHEBANG_EXIT_IO_ERROR = 3;     // File read/write errors
constexpr int SHEBANG_EXIT_INTERNAL = 4;     // Internal/unexpected errors

}  // namespace shebang::cli
