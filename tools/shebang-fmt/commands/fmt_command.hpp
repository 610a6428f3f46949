#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <vector>

namespace shebang::cli {

/**
 * Format files in place, check them, or filter stdin to stdout.
 *
 * Files named on the command line are always formatted. Files found by
 * walking a directory are formatted only if they match the resolved file
 * matching info, unless --all-files is given.
 */
class FmtCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "fmt"; }
    std::string description() const override {
        return "Normalize the shebang line of files";
    }

private:
    int format_stdin(CommandContext& ctx);

    std::vector<std::string> paths_;
    bool check_ = false;
    bool stdin_ = false;
    bool all_files_ = false;
};

}  // namespace shebang::cli
