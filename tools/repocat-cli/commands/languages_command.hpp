#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace repocat::cli {

/**
 * List the extension to language table.
 */
class LanguagesCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "languages"; }
    std::string description() const override {
        return "List recognised file extensions";
    }
};

}  // namespace repocat::cli
