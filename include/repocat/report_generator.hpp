#pragma once

#include <repocat/result.hpp>
#include <repocat/types.hpp>
#include <repocat/util/logger.hpp>

#include <string>
#include <utility>
#include <vector>

namespace repocat {

/**
 * ReportGenerator - builds the file-summary report for a directory tree.
 *
 * Scans the tree, classifies each file in scan order and renders the
 * result twice: a Markdown document (file-summaries.md) and a JSON record
 * (file-summaries.json). Both are written together or not at all.
 *
 * JSON layout, field order fixed:
 *   { "total_files": N,
 *     "files": [ { "path": ..., "language": ..., "summary": ... }, ... ] }
 */
class ReportGenerator {
public:
    explicit ReportGenerator(Logger* logger = nullptr);

    /**
     * Generate the report.
     *
     * An empty match set is not an error: nothing is written and the
     * outcome has no artifacts. In dry-run mode nothing is written either;
     * the outcome describes what would have been.
     *
     * @param root Directory to scan
     * @param output_dir Existing directory that receives both artifacts
     * @param filter Scan filter (exclude_patterns included)
     * @param dry_run Preview only
     * @return Outcome, or REPORT_FAILED wrapping the underlying cause
     */
    Result<ReportOutcome> generate(const fs::path& root,
                                   const fs::path& output_dir,
                                   const ScanFilter& filter,
                                   bool dry_run = false) const;

    // Classify scanned entries into report rows (scan order preserved)
    static ReportRecord build_record(const std::vector<FileEntry>& entries);

    static std::string render_markdown(const ReportRecord& record);
    static std::string render_json(const ReportRecord& record);

private:
    Result<ReportOutcome> run(const fs::path& root,
                              const fs::path& output_dir,
                              const ScanFilter& filter,
                              bool dry_run) const;

    Result<void> write_artifacts(const std::vector<std::pair<fs::path, std::string>>& docs) const;

    void log_info(const std::string& message) const;

    Logger* logger_;
};

}  // namespace repocat
