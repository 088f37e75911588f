#pragma once

#include "command.hpp"
#include "exit_codes.hpp"
#include <string>
#include <vector>

namespace repocat::cli {

/**
 * Generate file-summaries.md and file-summaries.json for a directory tree.
 *
 * Settings come from a config file (--config or $REPOCAT_CONFIG) when one
 * is given; command-line options override scalar values and extend the
 * pattern lists.
 */
class SummarizeCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "summarize"; }
    std::string description() const override {
        return "Write heuristic file summaries for a repository";
    }

private:
    // CLI options
    std::string root_;
    std::string output_dir_;
    std::string config_path_;
    std::vector<std::string> include_;
    std::vector<std::string> exclude_;
    std::vector<std::string> exclude_dirs_;
    bool dry_run_ = false;
    bool no_default_excludes_ = false;

    Result<SummaryConfig> resolve_config() const;
    void print_outcome(const ReportOutcome& outcome) const;
};

}  // namespace repocat::cli
