#pragma once

/**
 * shebang-fmt
 *
 * Normalizes the shebang line at the top of script files.
 */

#include <shebang/types.hpp>
#include <shebang/formatter.hpp>
#include <shebang/file_matching.hpp>
#include <shebang/config.hpp>
#include <shebang/plugin.hpp>
#include <shebang/file_walker.hpp>
