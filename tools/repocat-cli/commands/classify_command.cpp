#include "classify_command.hpp"

#include <nlohmann/json.hpp>

namespace repocat::cli {

void ClassifyCommand::setup(CLI::App& app) {
    app.add_option("paths", paths_, "File paths to classify")
        ->type_name("<path>")
        ->required();

    app.add_option("-r,--root", root_, "Root the paths are relative to (default: .)")
        ->type_name("<dir>");

    app.add_flag("--explain", explain_, "Show which summary rule fired");

    app.add_flag("--json", json_, "Print results as JSON");
}

int ClassifyCommand::execute(CommandContext& /* ctx */) {
    const std::filesystem::path root = absolute_path(root_);

    nlohmann::ordered_json results = nlohmann::ordered_json::array();
    for (const auto& raw : paths_) {
        const std::filesystem::path path = absolute_path(raw);
        Classification c = SummaryClassifier::classify(path, root);

        if (json_) {
            nlohmann::ordered_json item;
            item["path"] = raw;
            item["language"] = c.language;
            item["summary"] = c.summary;
            if (explain_) {
                item["rule"] = SummaryClassifier::matched_rule(path, root);
            }
            results.push_back(std::move(item));
            continue;
        }

        std::cout << raw << "\n"
                  << "  language: " << c.language << "\n"
                  << "  summary:  " << c.summary << "\n";
        if (explain_) {
            std::cout << "  rule:     " << SummaryClassifier::matched_rule(path, root) << "\n";
        }
    }

    if (json_) {
        std::cout << results.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
                  << "\n";
    }
    return REPOCAT_EXIT_SUCCESS;
}

}  // namespace repocat::cli
