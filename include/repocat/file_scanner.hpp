#pragma once

#include <repocat/result.hpp>
#include <repocat/types.hpp>
#include <repocat/util/logger.hpp>

#include <string>
#include <vector>

namespace repocat {

/**
 * FileScanner - walks a directory tree and returns the files to report on.
 *
 * Symbolic links are never followed: a symlinked directory is pruned
 * before descent and a symlinked file is skipped. Directories named in
 * ScanFilter::exclude_dirs are pruned before recursion. The result is
 * sorted by full path, so it does not depend on enumeration order.
 */
class FileScanner {
public:
    explicit FileScanner(Logger* logger = nullptr);

    /**
     * Scan a directory tree.
     *
     * @param root Directory to scan
     * @param filter Include/exclude patterns and excluded directory names
     * @return Sorted entries; NOT_FOUND if root is missing,
     *         INVALID_ARGUMENT if it is not a directory
     */
    Result<std::vector<FileEntry>> scan(const fs::path& root,
                                        const ScanFilter& filter) const;

    /**
     * Match a file name against simple patterns.
     *
     * "*suffix" matches by suffix, "prefix*" by prefix, anything else must
     * equal the name. There is no wildcard support in the middle.
     */
    static bool matches_pattern(const std::string& filename,
                                const std::vector<std::string>& patterns);

    // Include patterns first (empty = all), then exclude patterns
    static bool passes_filter(const std::string& filename, const ScanFilter& filter);

private:
    Result<void> walk(const fs::path& dir,
                      const fs::path& root,
                      const ScanFilter& filter,
                      std::vector<FileEntry>& out) const;

    static FileEntry make_entry(const fs::path& path, const fs::path& root);

    Logger* logger_;
};

}  // namespace repocat
