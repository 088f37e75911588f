#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace repocat {

namespace fs = std::filesystem;

// Label used when an extension is not in the language table
inline const std::string UNKNOWN_LANGUAGE = "Unknown";

// Fixed artifact names inside the output directory
inline const std::string MARKDOWN_REPORT_NAME = "file-summaries.md";
inline const std::string JSON_REPORT_NAME = "file-summaries.json";

/**
 * A discovered, filtered, non-symlink file.
 */
struct FileEntry {
    fs::path path;              // Absolute, lexically normal
    std::string relative_path;  // Relative to scan root, '/' separated
    std::string name;           // Final path component
    std::string extension;      // Lower-cased, with leading dot ("" if none)
};

/**
 * Which files a scan returns.
 *
 * Include patterns are checked first (empty = include everything), then
 * exclude patterns, which win. Directory names are pruned before descent.
 */
struct ScanFilter {
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    std::set<std::string> exclude_dirs;
};

struct Classification {
    std::string language;
    std::string summary;
};

// One row of the report
struct FileSummary {
    std::string path;      // posix-style, relative to root
    std::string language;
    std::string summary;
};

struct ReportRecord {
    std::vector<FileSummary> files;

    size_t total_files() const { return files.size(); }
};

// What was (or in dry-run mode, would have been) written
struct ArtifactInfo {
    fs::path path;
    size_t bytes = 0;
    size_t entries = 0;
    bool written = false;
};

struct ReportOutcome {
    bool dry_run = false;
    size_t total_files = 0;
    std::vector<ArtifactInfo> artifacts;  // Empty when nothing matched
};

}  // namespace repocat
