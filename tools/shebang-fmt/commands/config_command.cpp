#include "config_command.hpp"

namespace shebang::cli {

void ConfigCommand::setup(CLI::App& app) {
    app.add_flag("--file-matching", file_matching_only_,
                 "Print only the file extensions and names");
}

int ConfigCommand::execute(CommandContext& ctx) {
    nlohmann::json out;
    if (file_matching_only_) {
        out = ctx.resolved->file_matching;
    } else {
        out = *ctx.resolved;
    }
    std::cout << out.dump(2) << "\n";
    return SHEBANG_EXIT_SUCCESS;
}

}  // namespace shebang::cli
