#pragma once

#include <repocat/result.hpp>
#include <repocat/types.hpp>

#include <set>
#include <string>

namespace repocat {

/**
 * Settings for one report run, usually read from a JSON config file:
 *
 *   {
 *     "output_dir": "docs/generated",
 *     "dry_run": false,
 *     "file_summary_config": {
 *       "include_patterns": ["*.py", "*.js"],
 *       "exclude_patterns": ["*_pb2.py"],
 *       "exclude_dirs": ["build"]
 *     }
 *   }
 *
 * Every key is optional; unknown keys and sections are ignored.
 */
struct SummaryConfig {
    fs::path root = ".";
    fs::path output_dir = ".";
    ScanFilter filter;
    bool dry_run = false;
    bool verbose = false;
};

// Environment variable naming a config file used when none is given
constexpr const char* CONFIG_ENV_VAR = "REPOCAT_CONFIG";

/**
 * Load a config file.
 *
 * @return NOT_FOUND if the file is missing, CONFIG_ERROR if it is not
 *         valid JSON or a value has the wrong type
 */
Result<SummaryConfig> load_config(const fs::path& path);

// Parse config JSON text
Result<SummaryConfig> parse_config(const std::string& text);

// Directory names pruned by default (VCS metadata, caches, virtualenvs)
std::set<std::string> default_exclude_dirs();

}  // namespace repocat
