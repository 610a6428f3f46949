#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace shebang::cli {

/**
 * Print the resolved configuration, its diagnostics and the file
 * matching info as JSON.
 */
class ConfigCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "config"; }
    std::string description() const override {
        return "Print the resolved configuration as JSON";
    }

private:
    bool file_matching_only_ = false;
};

}  // namespace shebang::cli
