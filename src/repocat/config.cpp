#include <repocat/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace repocat {

namespace {

using json = nlohmann::json;

// Absent or null keys give an empty list; nullopt means "not an array"
std::optional<std::vector<std::string>> string_list(const json& section, const char* key) {
    if (!section.contains(key) || section[key].is_null()) {
        return std::vector<std::string>{};
    }
    const json& value = section[key];
    if (!value.is_array()) {
        return std::nullopt;
    }
    return value.get<std::vector<std::string>>();
}

}  // namespace

Result<SummaryConfig> parse_config(const std::string& text) {
    SummaryConfig config;

    try {
        json doc = json::parse(text);
        if (!doc.is_object()) {
            return Error(ErrorCode::CONFIG_ERROR, "Config root must be a JSON object");
        }

        if (doc.contains("output_dir") && !doc["output_dir"].is_null()) {
            config.output_dir = doc["output_dir"].get<std::string>();
        }
        if (doc.contains("dry_run") && !doc["dry_run"].is_null()) {
            config.dry_run = doc["dry_run"].get<bool>();
        }

        if (doc.contains("file_summary_config") && doc["file_summary_config"].is_object()) {
            const json& section = doc["file_summary_config"];
            auto include = string_list(section, "include_patterns");
            auto exclude = string_list(section, "exclude_patterns");
            auto dirs = string_list(section, "exclude_dirs");
            if (!include || !exclude || !dirs) {
                return Error(ErrorCode::CONFIG_ERROR,
                             "file_summary_config patterns and exclude_dirs must be arrays of strings");
            }
            config.filter.include_patterns = std::move(*include);
            config.filter.exclude_patterns = std::move(*exclude);
            config.filter.exclude_dirs.insert(dirs->begin(), dirs->end());
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::CONFIG_ERROR, e.what());
    }

    return config;
}

Result<SummaryConfig> load_config(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error(ErrorCode::NOT_FOUND, "Config file not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open config file: " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.fail() && !file.eof()) {
        return Error(ErrorCode::IO_ERROR, "Failed to read config file: " + path.string());
    }

    auto parsed = parse_config(ss.str());
    if (!parsed.ok()) {
        return Error(parsed.error_code(), path.string() + ": " + parsed.error().message());
    }
    return parsed;
}

std::set<std::string> default_exclude_dirs() {
    return {
        ".git", ".hg", ".svn",
        "node_modules",
        "__pycache__", ".mypy_cache", ".pytest_cache", ".tox",
        ".venv", "venv",
    };
}

}  // namespace repocat
