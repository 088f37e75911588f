#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace repocat {

/**
 * Detects a file's language from its extension alone.
 *
 * The lookup uses a fixed extension table; ambiguous extensions map to one
 * label (".h" is always "C/C++"). Unmapped or missing extensions give
 * "Unknown". Never fails.
 */
class LanguageDetector {
public:
    /**
     * Detect language from a path's final component.
     *
     * @param path File path (only the file name is inspected)
     * @return Language label, or "Unknown"
     */
    static std::string detect(const std::filesystem::path& path);

    /**
     * Lower-cased extension including the dot.
     *
     * A leading dot (".gitignore") or a trailing dot ("name.") does not
     * start an extension; both return "".
     */
    static std::string extension_of(const std::string& filename);

    /**
     * File name without its extension, case preserved.
     */
    static std::string stem_of(const std::string& filename);

    // Extension table sorted by extension, for listing
    static std::vector<std::pair<std::string, std::string>> table();

private:
    static std::string from_extension(const std::string& extension);
};

}  // namespace repocat
