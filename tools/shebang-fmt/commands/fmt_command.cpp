#include "fmt_command.hpp"

#include <shebang/file_walker.hpp>

namespace shebang::cli {

namespace fs = std::filesystem;

void FmtCommand::setup(CLI::App& app) {
    app.add_option("paths", paths_, "Files or directories to format")
        ->type_name("<path>");

    app.add_flag("--check", check_,
                 "List files that need formatting, modify nothing");

    app.add_flag("--stdin", stdin_, "Read from stdin, write to stdout")
        ->excludes("paths");

    app.add_flag("--all-files", all_files_,
                 "Format every file found in directories, not only scripts");
}

int FmtCommand::execute(CommandContext& ctx) {
    if (stdin_) {
        return format_stdin(ctx);
    }

    if (paths_.empty()) {
        std::cerr << "Usage: shebang-fmt fmt <path>... [--check] [--all-files]\n";
        std::cerr << "       shebang-fmt fmt --stdin [--check]\n";
        return SHEBANG_EXIT_USER_ERROR;
    }

    std::vector<fs::path> roots(paths_.begin(), paths_.end());
    auto files_result = collect_files(roots, ctx.resolved->file_matching,
                                      all_files_, ctx.logger);
    if (!files_result.ok()) {
        ctx.logger->error(files_result.error().to_string());
        return SHEBANG_EXIT_IO_ERROR;
    }
    const auto& files = files_result.value();

    bool failed = false;
    bool internal = false;
    size_t changed_count = 0;
    for (const auto& path : files) {
        auto outcome = format_file(*ctx.handler, path, check_);
        if (!outcome.ok()) {
            ctx.logger->error(outcome.error().to_string());
            failed = true;
            internal = internal || outcome.error_code() == ErrorCode::INTERNAL_ERROR;
            continue;
        }

        switch (outcome.value()) {
            case FileOutcome::UNCHANGED:
                break;
            case FileOutcome::NEEDS_FORMATTING:
                std::cout << path.string() << "\n";
                changed_count++;
                break;
            case FileOutcome::FORMATTED:
                ctx.logger->debug("Formatted " + path.string());
                changed_count++;
                break;
        }
    }

    if (check_) {
        ctx.logger->info(std::to_string(changed_count) + " of " +
                         std::to_string(files.size()) + " file(s) need formatting");
    } else {
        ctx.logger->info("Formatted " + std::to_string(changed_count) + " of " +
                         std::to_string(files.size()) + " file(s)");
    }

    if (internal) {
        return SHEBANG_EXIT_INTERNAL;
    }
    if (failed) {
        return SHEBANG_EXIT_IO_ERROR;
    }
    if (check_ && changed_count > 0) {
        return SHEBANG_EXIT_CHANGED;
    }
    return SHEBANG_EXIT_SUCCESS;
}

int FmtCommand::format_stdin(CommandContext& ctx) {
    std::string text = read_stdin();

    FormatRequest request;
    request.file_path = "<stdin>";
    request.file_text = text;

    auto result = ctx.handler->format(request);
    if (!result.ok()) {
        Error error(ErrorCode::INTERNAL_ERROR, result.error().to_string());
        std::cerr << "Error: " << error.to_string() << "\n";
        return SHEBANG_EXIT_INTERNAL;
    }

    const auto& formatted = result.value();
    if (check_) {
        if (formatted) {
            std::cout << "<stdin>\n";
            return SHEBANG_EXIT_CHANGED;
        }
        return SHEBANG_EXIT_SUCCESS;
    }

    std::cout << (formatted ? *formatted : text);
    std::cout.flush();
    return SHEBANG_EXIT_SUCCESS;
}

}  // namespace shebang::cli
