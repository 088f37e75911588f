#pragma once

#include <repocat/types.hpp>

#include <string>
#include <vector>

namespace repocat {

/**
 * Name and path facts a summary rule can test.
 */
struct NameContext {
    std::string stem;                   // File name without extension
    std::string stem_lower;
    std::string extension;              // Lower-cased, with dot
    std::string language;
    std::vector<std::string> dir_parts; // Directories between root and file
};

/**
 * Heuristic one-line summaries derived from file names and paths.
 *
 * Rules are evaluated in a fixed order and the first match wins; several
 * rules can match the same name (api_test.py is both a test and an API
 * file), so the order is part of the behavior. Pure and total.
 */
class SummaryClassifier {
public:
    /**
     * Summarize a file.
     *
     * @param path File path
     * @param root Scan root; a path outside it is treated as top-level
     * @return Non-empty summary text
     */
    static std::string summarize(const fs::path& path, const fs::path& root);

    // Language and summary together
    static Classification classify(const fs::path& path, const fs::path& root);

    // Same, using the entry's root-relative path
    static Classification classify(const FileEntry& entry);

    /**
     * Id of the rule that produced the summary ("default" if none matched).
     */
    static std::string matched_rule(const fs::path& path, const fs::path& root);

    // Rule ids in evaluation order, "default" last
    static std::vector<std::string> rule_ids();

    static NameContext make_context(const fs::path& path, const fs::path& root);

    /**
     * Directory components between root and the file's parent.
     * Empty when the file sits directly under root or is not under it.
     */
    static std::vector<std::string> relative_dir_parts(const fs::path& path,
                                                       const fs::path& root);
};

}  // namespace repocat
