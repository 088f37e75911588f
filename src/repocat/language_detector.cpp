#include <repocat/language_detector.hpp>
#include <repocat/types.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace repocat {

namespace {

// Extension to language mapping
const std::unordered_map<std::string, std::string> EXTENSION_MAP = {
    // Python
    {".py", "Python"},

    // JavaScript/TypeScript
    {".js", "JavaScript"},
    {".jsx", "JavaScript"},
    {".ts", "TypeScript"},
    {".tsx", "TypeScript"},

    // JVM
    {".java", "Java"},
    {".kt", "Kotlin"},
    {".scala", "Scala"},

    {".go", "Go"},
    {".rs", "Rust"},
    {".rb", "Ruby"},
    {".php", "PHP"},

    // C family
    {".c", "C"},
    {".cpp", "C++"},
    {".cc", "C++"},
    {".cxx", "C++"},
    {".h", "C/C++"},
    {".hpp", "C++"},
    {".cs", "C#"},
    {".m", "Objective-C"},
    {".swift", "Swift"},

    // Shell
    {".sh", "Shell"},
    {".bash", "Bash"},
    {".zsh", "Zsh"},
    {".ps1", "PowerShell"},

    {".r", "R"},
    {".sql", "SQL"},

    // Web
    {".html", "HTML"},
    {".css", "CSS"},
    {".scss", "SCSS"},
    {".sass", "Sass"},
    {".less", "Less"},
    {".vue", "Vue"},

    // Docs
    {".md", "Markdown"},
    {".rst", "reStructuredText"},

    // Data and config formats
    {".yml", "YAML"},
    {".yaml", "YAML"},
    {".json", "JSON"},
    {".xml", "XML"},
    {".toml", "TOML"},
    {".ini", "INI"},
    {".cfg", "Config"},
    {".conf", "Config"},
};

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Position of the dot that starts the extension, or npos
size_t extension_dot(const std::string& filename) {
    size_t dot_pos = filename.rfind('.');
    if (dot_pos == std::string::npos || dot_pos == 0 ||
        dot_pos == filename.length() - 1) {
        return std::string::npos;
    }
    return dot_pos;
}

}  // namespace

std::string LanguageDetector::detect(const std::filesystem::path& path) {
    std::string lang = from_extension(extension_of(path.filename().string()));
    if (!lang.empty()) {
        return lang;
    }
    return UNKNOWN_LANGUAGE;
}

std::string LanguageDetector::extension_of(const std::string& filename) {
    size_t dot_pos = extension_dot(filename);
    if (dot_pos == std::string::npos) {
        return "";
    }
    return to_lower(filename.substr(dot_pos));
}

std::string LanguageDetector::stem_of(const std::string& filename) {
    size_t dot_pos = extension_dot(filename);
    if (dot_pos == std::string::npos) {
        return filename;
    }
    return filename.substr(0, dot_pos);
}

std::vector<std::pair<std::string, std::string>> LanguageDetector::table() {
    std::vector<std::pair<std::string, std::string>> entries(
        EXTENSION_MAP.begin(), EXTENSION_MAP.end());
    std::sort(entries.begin(), entries.end());
    return entries;
}

std::string LanguageDetector::from_extension(const std::string& extension) {
    if (extension.empty()) {
        return "";
    }

    auto it = EXTENSION_MAP.find(extension);
    if (it != EXTENSION_MAP.end()) {
        return it->second;
    }

    return "";
}

}  // namespace repocat
