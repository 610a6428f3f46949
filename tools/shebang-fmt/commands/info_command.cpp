#include "info_command.hpp"

namespace shebang::cli {

void InfoCommand::setup(CLI::App& /* app */) {
    // No options for info command
}

int InfoCommand::execute(CommandContext& ctx) {
    nlohmann::json info = ctx.handler->plugin_info();
    std::cout << info.dump(2) << "\n";
    return SHEBANG_EXIT_SUCCESS;
}

}  // namespace shebang::cli
