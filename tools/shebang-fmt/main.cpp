#include <shebang/shebang.hpp>

#include "commands/command.hpp"
#include "commands/config_command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/fmt_command.hpp"
#include "commands/info_command.hpp"

#include <memory>
#include <utility>
#include <vector>

using namespace shebang;
using namespace shebang::cli;

int main(int argc, char* argv[]) {
    CLI::App app{"Normalize the shebang line of script files", "shebang-fmt"};
    app.set_version_flag("--version", SHEBANG_VERSION);
    app.require_subcommand(1);

    bool verbose = false;
    bool quiet = false;
    std::string config_path;

    app.add_flag("-v,--verbose", verbose, "Log every file decision");
    app.add_flag("-q,--quiet", quiet, "Log errors only")->excludes("--verbose");
    app.add_option("-c,--config", config_path, "Host configuration file (JSON)")
        ->type_name("<file>");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<FmtCommand>());
    commands.push_back(std::make_unique<InfoCommand>());
    commands.push_back(std::make_unique<ConfigCommand>());

    std::vector<std::pair<CLI::App*, Command*>> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.emplace_back(sub, command.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version exit with 0
        return app.exit(e) == 0 ? SHEBANG_EXIT_SUCCESS : SHEBANG_EXIT_USER_ERROR;
    }

    ConsoleLogger logger;
    if (verbose) {
        logger.set_min_level(LogLevel::DEBUG);
    } else if (quiet) {
        logger.set_min_level(LogLevel::ERROR);
    }

    PluginHandler handler(&logger);
    const std::string config_key = handler.plugin_info().config_key;

    HostConfig host_config;
    if (!config_path.empty()) {
        auto loaded = load_host_config(config_path, config_key);
        if (!loaded.ok()) {
            std::cerr << "Error: " << loaded.error().to_string() << "\n";
            return loaded.error_code() == ErrorCode::IO_ERROR
                ? SHEBANG_EXIT_IO_ERROR
                : SHEBANG_EXIT_USER_ERROR;
        }
        host_config = std::move(loaded.value());
        logger.debug("Loaded configuration from " + config_path);
    }

    auto resolved = handler.resolve_config(host_config.plugin_config, host_config.global);
    for (const auto& diagnostic : resolved.diagnostics) {
        logger.warning(diagnostic.property_name + ": " + diagnostic.message);
    }

    CommandContext ctx;
    ctx.handler = &handler;
    ctx.resolved = &resolved;
    ctx.logger = &logger;

    for (auto& [sub, command] : subcommands) {
        if (sub->parsed()) {
            return command->execute(ctx);
        }
    }

    std::cerr << "Run 'shebang-fmt --help' for available commands.\n";
    return SHEBANG_EXIT_USER_ERROR;
}
