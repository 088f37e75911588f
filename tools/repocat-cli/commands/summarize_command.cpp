#include "summarize_command.hpp"

#include <system_error>
#include <utility>

namespace repocat::cli {

void SummarizeCommand::setup(CLI::App& app) {
    app.add_option("root", root_, "Repository root (default: current directory)")
        ->type_name("<dir>");

    app.add_option("-o,--output", output_dir_, "Directory for file-summaries.{md,json}")
        ->type_name("<dir>");

    app.add_option("-i,--include", include_, "Include pattern, e.g. '*.py' (repeatable)")
        ->type_name("<pattern>");

    app.add_option("-e,--exclude", exclude_, "Exclude pattern (repeatable)")
        ->type_name("<pattern>");

    app.add_option("-x,--exclude-dir", exclude_dirs_, "Directory name to skip (repeatable)")
        ->type_name("<name>");

    app.add_option("-c,--config", config_path_, "JSON config file")
        ->type_name("<file>");

    app.add_flag("--dry-run", dry_run_, "Show what would be written without writing");

    app.add_flag("--no-default-excludes", no_default_excludes_,
                 "Do not skip .git, node_modules, __pycache__ and similar directories");
}

Result<SummaryConfig> SummarizeCommand::resolve_config() const {
    SummaryConfig config;

    std::filesystem::path config_file =
        config_path_.empty() ? get_env_config_path() : std::filesystem::path(config_path_);
    if (!config_file.empty()) {
        auto loaded = load_config(config_file);
        if (!loaded.ok()) {
            return loaded.error();
        }
        config = std::move(loaded.value());
    }

    if (!no_default_excludes_) {
        auto defaults = default_exclude_dirs();
        config.filter.exclude_dirs.insert(defaults.begin(), defaults.end());
    }

    if (!root_.empty()) config.root = root_;
    if (!output_dir_.empty()) config.output_dir = output_dir_;
    if (dry_run_) config.dry_run = true;

    auto& filter = config.filter;
    filter.include_patterns.insert(filter.include_patterns.end(), include_.begin(), include_.end());
    filter.exclude_patterns.insert(filter.exclude_patterns.end(), exclude_.begin(), exclude_.end());
    filter.exclude_dirs.insert(exclude_dirs_.begin(), exclude_dirs_.end());

    return config;
}

int SummarizeCommand::execute(CommandContext& ctx) {
    auto config_result = resolve_config();
    if (!config_result.ok()) {
        std::cerr << "Error: " << config_result.error().to_string() << "\n";
        return exit_code_for(config_result.error());
    }
    SummaryConfig config = std::move(config_result.value());

    std::error_code ec;
    if (!std::filesystem::exists(config.root, ec)) {
        std::cerr << "Error: Directory not found: " << config.root.string() << "\n";
        return REPOCAT_EXIT_NOT_FOUND;
    }
    if (!std::filesystem::is_directory(config.root, ec)) {
        std::cerr << "Error: Not a directory: " << config.root.string() << "\n";
        return REPOCAT_EXIT_USER_ERROR;
    }

    // The generator expects an existing output directory
    if (!config.dry_run) {
        std::filesystem::create_directories(config.output_dir, ec);
        if (ec) {
            std::cerr << "Error: Cannot create output directory "
                      << config.output_dir.string() << ": " << ec.message() << "\n";
            return REPOCAT_EXIT_IO_ERROR;
        }
    }

    if (ctx.verbose && ctx.logger) {
        ctx.logger->debug("Root: " + absolute_path(config.root).string());
        ctx.logger->debug("Output: " + absolute_path(config.output_dir).string());
        ctx.logger->debug("Excluded directories: " +
                          std::to_string(config.filter.exclude_dirs.size()));
    }

    ReportGenerator generator(ctx.logger);
    auto result = generator.generate(config.root, config.output_dir, config.filter,
                                     config.dry_run);
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return exit_code_for(result.error());
    }

    print_outcome(result.value());
    return REPOCAT_EXIT_SUCCESS;
}

void SummarizeCommand::print_outcome(const ReportOutcome& outcome) const {
    if (outcome.total_files == 0) {
        return;
    }

    if (outcome.dry_run) {
        std::cout << outcome.total_files
                  << " file(s) would be catalogued (dry run, nothing written)\n";
        return;
    }

    std::cout << outcome.total_files << " file(s) catalogued\n";
    for (const auto& artifact : outcome.artifacts) {
        std::cout << "  " << artifact.path.string() << " (" << artifact.bytes << " bytes)\n";
    }
}

}  // namespace repocat::cli
