#include "languages_command.hpp"
#include <iomanip>

namespace repocat::cli {

void LanguagesCommand::setup(CLI::App& /* app */) {
    // No options for languages command
}

int LanguagesCommand::execute(CommandContext& /* ctx */) {
    auto table = LanguageDetector::table();

    std::cout << std::left
              << std::setw(12) << "EXTENSION"
              << "LANGUAGE\n";
    std::cout << std::string(40, '-') << "\n";

    for (const auto& [extension, language] : table) {
        std::cout << std::left
                  << std::setw(12) << extension
                  << language << "\n";
    }

    std::cout << "\n" << table.size() << " extension(s); anything else is "
              << UNKNOWN_LANGUAGE << "\n";
    return REPOCAT_EXIT_SUCCESS;
}

}  // namespace repocat::cli
