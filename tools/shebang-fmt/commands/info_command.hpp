#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace shebang::cli {

/**
 * Print plugin metadata as JSON.
 */
class InfoCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "info"; }
    std::string description() const override {
        return "Print plugin information as JSON";
    }
};

}  // namespace shebang::cli
