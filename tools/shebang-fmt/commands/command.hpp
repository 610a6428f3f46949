#pragma once

#include <shebang/shebang.hpp>
#include <CLI/CLI.hpp>
#include <iostream>
#include <sstream>
#include <string>

namespace shebang::cli {

/**
 * Context passed to command execution.
 * Contains the plugin handler, its resolved configuration and the logger.
 */
struct CommandContext {
    PluginHandler* handler = nullptr;
    const ResolveConfigurationResult* resolved = nullptr;
    Logger* logger = nullptr;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
};

/**
 * Read from stdin until EOF.
 */
inline std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

}  // namespace shebang::cli
