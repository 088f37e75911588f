#include "commands/command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/classify_command.hpp"
#include "commands/languages_command.hpp"
#include "commands/summarize_command.hpp"

#include <exception>
#include <memory>
#include <utility>
#include <vector>

using namespace repocat::cli;

int main(int argc, char* argv[]) {
    CLI::App app{"repocat - catalogue every file in a repository by language and role"};
    app.require_subcommand(1);
    app.fallthrough();

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Show debug output");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<SummarizeCommand>());
    commands.push_back(std::make_unique<ClassifyCommand>());
    commands.push_back(std::make_unique<LanguagesCommand>());

    std::vector<std::pair<CLI::App*, Command*>> registered;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        registered.emplace_back(sub, command.get());
    }

    CLI11_PARSE(app, argc, argv);

    repocat::ConsoleLogger logger;
    if (verbose) {
        logger.set_min_level(repocat::LogLevel::DEBUG);
    }

    CommandContext ctx;
    ctx.logger = &logger;
    ctx.verbose = verbose;

    for (auto& [sub, command] : registered) {
        if (!sub->parsed()) continue;
        try {
            return command->execute(ctx);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return REPOCAT_EXIT_INTERNAL;
        }
    }

    std::cerr << "Run 'repocat --help' for available commands.\n";
    return REPOCAT_EXIT_USER_ERROR;
}
