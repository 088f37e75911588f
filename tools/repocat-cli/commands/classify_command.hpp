#pragma once

#include "command.hpp"
#include "exit_codes.hpp"
#include <string>
#include <vector>

namespace repocat::cli {

/**
 * Print language and summary for individual paths.
 *
 * Works on names only; the paths do not have to exist.
 */
class ClassifyCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "classify"; }
    std::string description() const override {
        return "Classify file paths without scanning";
    }

private:
    std::vector<std::string> paths_;
    std::string root_ = ".";
    bool explain_ = false;
    bool json_ = false;
};

}  // namespace repocat::cli
