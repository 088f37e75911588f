#include <repocat/file_scanner.hpp>
#include <repocat/language_detector.hpp>

#include <algorithm>
#include <iterator>
#include <system_error>

namespace repocat {

namespace {

Error fs_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
    ErrorCode code = ec == std::errc::permission_denied ? ErrorCode::PERMISSION_DENIED
                                                        : ErrorCode::IO_ERROR;
    return Error(code, what + " '" + path.string() + "': " + ec.message());
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

FileScanner::FileScanner(Logger* logger)
    : logger_(logger) {}

bool FileScanner::matches_pattern(const std::string& filename,
                                  const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (!pattern.empty() && pattern.front() == '*') {
            // Suffix match (*.py)
            if (ends_with(filename, pattern.substr(1))) {
                return true;
            }
        } else if (!pattern.empty() && pattern.back() == '*') {
            // Prefix match (test*)
            if (starts_with(filename, pattern.substr(0, pattern.size() - 1))) {
                return true;
            }
        } else if (filename == pattern) {
            return true;
        }
    }
    return false;
}

bool FileScanner::passes_filter(const std::string& filename, const ScanFilter& filter) {
    if (!filter.include_patterns.empty() &&
        !matches_pattern(filename, filter.include_patterns)) {
        return false;
    }
    if (!filter.exclude_patterns.empty() &&
        matches_pattern(filename, filter.exclude_patterns)) {
        return false;
    }
    return true;
}

Result<std::vector<FileEntry>> FileScanner::scan(const fs::path& root,
                                                 const ScanFilter& filter) const {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return Error(ErrorCode::NOT_FOUND, "Root path does not exist: " + root.string());
    }
    if (!fs::is_directory(root, ec)) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Root path is not a directory: " + root.string());
    }

    fs::path abs_root = fs::absolute(root, ec);
    if (ec) {
        return fs_error("Cannot resolve root", root, ec);
    }
    abs_root = abs_root.lexically_normal();
    if (!abs_root.has_filename()) {
        abs_root = abs_root.parent_path();  // Drop trailing separator
    }

    if (logger_) {
        logger_->debug("Scanning " + abs_root.string());
    }

    std::vector<FileEntry> entries;
    auto walked = walk(abs_root, abs_root, filter, entries);
    if (!walked.ok()) {
        return walked.error();
    }

    // Sort once collection is complete; enumeration order is unspecified
    std::sort(entries.begin(), entries.end(),
              [](const FileEntry& a, const FileEntry& b) {
                  return a.path.generic_string() < b.path.generic_string();
              });

    if (logger_) {
        logger_->debug("Scan complete: " + std::to_string(entries.size()) + " file(s)");
    }
    return entries;
}

Result<void> FileScanner::walk(const fs::path& dir,
                               const fs::path& root,
                               const ScanFilter& filter,
                               std::vector<FileEntry>& out) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return fs_error("Cannot read directory", dir, ec);
    }

    // Entries are kept only if the whole listing succeeds
    std::vector<FileEntry> files;
    std::vector<fs::path> subdirs;
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        const std::string name = entry.path().filename().string();

        std::error_code status_ec;
        if (entry.is_symlink(status_ec)) {
            if (logger_) {
                logger_->debug("Skipping symlink " + entry.path().string());
            }
            continue;
        }

        if (entry.is_directory(status_ec)) {
            // Prune before descending
            if (filter.exclude_dirs.count(name) > 0) {
                if (logger_) {
                    logger_->debug("Pruning excluded directory " + entry.path().string());
                }
                continue;
            }
            subdirs.push_back(entry.path());
            continue;
        }

        if (status_ec) {
            if (logger_) {
                logger_->warning("Cannot stat " + entry.path().string() + ": " +
                                 status_ec.message());
            }
            continue;
        }

        if (!passes_filter(name, filter)) {
            continue;
        }

        files.push_back(make_entry(entry.path(), root));
    }

    if (ec) {
        return fs_error("Error while listing directory", dir, ec);
    }
    out.insert(out.end(), std::make_move_iterator(files.begin()),
               std::make_move_iterator(files.end()));

    for (const auto& subdir : subdirs) {
        auto walked = walk(subdir, root, filter, out);
        if (!walked.ok()) {
            // An unreadable subdirectory is skipped, only the root is fatal
            if (logger_) {
                logger_->warning("Skipping unreadable directory: " +
                                 walked.error().to_string());
            }
        }
    }

    return Ok();
}

FileEntry FileScanner::make_entry(const fs::path& path, const fs::path& root) {
    FileEntry entry;
    entry.path = path;
    entry.relative_path = path.lexically_relative(root).generic_string();
    entry.name = path.filename().string();
    entry.extension = LanguageDetector::extension_of(entry.name);
    return entry;
}

}  // namespace repocat
