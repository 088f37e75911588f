#include <repocat/summary_classifier.hpp>
#include <repocat/language_detector.hpp>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace repocat {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

bool one_of(const std::string& s, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (s == name) return true;
    }
    return false;
}

std::string top_dir(const NameContext& ctx) {
    return ctx.dir_parts.empty() ? std::string() : to_lower(ctx.dir_parts.front());
}

bool under_test_dir(const NameContext& ctx) {
    return std::find_if(ctx.dir_parts.begin(), ctx.dir_parts.end(),
                        [](const std::string& part) {
                            return part == "tests" || part == "test";
                        }) != ctx.dir_parts.end();
}

bool is_module_init(const NameContext& ctx) {
    return one_of(ctx.stem_lower, {"__init__", "index", "mod"});
}

struct SummaryRule {
    const char* id;
    bool (*matches)(const NameContext&);
    const char* phrase;  // Appended to "<Language> "
};

// Evaluation order is significant: first match wins.
const SummaryRule RULES[] = {
    {"config",
     [](const NameContext& c) {
         return one_of(c.stem_lower, {"config", "configuration", "settings"});
     },
     "configuration file"},
    {"test",
     [](const NameContext& c) {
         return starts_with(c.stem_lower, "test_") || ends_with(c.stem_lower, "_test") ||
                starts_with(c.stem_lower, "test");
     },
     "test file"},
    {"entry_point",
     [](const NameContext& c) {
         return one_of(c.stem_lower, {"main", "index", "app", "__main__"});
     },
     "main entry point"},
    {"cli",
     [](const NameContext& c) { return one_of(c.stem_lower, {"cli", "command", "commands"}); },
     "command-line interface"},
    {"utility",
     [](const NameContext& c) {
         return one_of(c.stem_lower, {"utils", "util", "utilities", "helpers", "helper"});
     },
     "utility functions"},
    {"model",
     [](const NameContext& c) {
         return one_of(c.stem_lower, {"model", "models", "schema", "schemas"});
     },
     "data models"},
    {"handler",
     [](const NameContext& c) {
         return one_of(c.stem_lower, {"controller", "controllers", "handler", "handlers"});
     },
     "request handlers"},
    {"view",
     [](const NameContext& c) {
         return one_of(c.stem_lower, {"view", "views", "template", "templates"});
     },
     "view templates"},
    {"service",
     [](const NameContext& c) { return one_of(c.stem_lower, {"service", "services"}); },
     "service layer"},
    {"repository",
     [](const NameContext& c) {
         return one_of(c.stem_lower, {"repository", "repositories", "dao"});
     },
     "data access layer"},
    {"api",
     [](const NameContext& c) { return contains(c.stem_lower, "api"); },
     "API implementation"},
    {"database",
     [](const NameContext& c) {
         return contains(c.stem_lower, "db") || contains(c.stem_lower, "database");
     },
     "database operations"},
    {"router",
     [](const NameContext& c) {
         return contains(c.stem_lower, "router") || contains(c.stem_lower, "routes");
     },
     "routing configuration"},
    {"middleware",
     [](const NameContext& c) { return contains(c.stem_lower, "middleware"); },
     "middleware component"},
    {"component",
     [](const NameContext& c) {
         return one_of(c.extension, {".jsx", ".tsx", ".vue"}) ||
                contains(c.stem_lower, "component");
     },
     "UI component"},
    {"test_module_init",
     [](const NameContext& c) { return is_module_init(c) && under_test_dir(c); },
     "test module initialization"},
    {"module_init",
     [](const NameContext& c) { return is_module_init(c); },
     "module initialization"},
    {"test_dir",
     [](const NameContext& c) { return one_of(top_dir(c), {"tests", "test"}); },
     "test implementation"},
    {"source_dir",
     [](const NameContext& c) { return one_of(top_dir(c), {"src", "lib", "core"}); },
     "core implementation"},
    {"script_dir",
     [](const NameContext& c) { return one_of(top_dir(c), {"scripts", "bin"}); },
     "utility script"},
    {"docs_dir",
     [](const NameContext& c) { return one_of(top_dir(c), {"docs", "documentation"}); },
     "documentation file"},
    {"examples_dir",
     [](const NameContext& c) {
         return one_of(top_dir(c), {"examples", "demos", "samples"});
     },
     "example code"},
};

const SummaryRule* find_rule(const NameContext& ctx) {
    for (const auto& rule : RULES) {
        if (rule.matches(ctx)) {
            return &rule;
        }
    }
    return nullptr;
}

NameContext build_context(const fs::path& path, std::vector<std::string> dir_parts) {
    const std::string filename = path.filename().string();

    NameContext ctx;
    ctx.stem = LanguageDetector::stem_of(filename);
    ctx.stem_lower = to_lower(ctx.stem);
    ctx.extension = LanguageDetector::extension_of(filename);
    ctx.language = LanguageDetector::detect(path);
    ctx.dir_parts = std::move(dir_parts);
    return ctx;
}

std::string default_summary(const NameContext& ctx) {
    std::string words = ctx.stem;
    std::replace(words.begin(), words.end(), '_', ' ');
    std::replace(words.begin(), words.end(), '-', ' ');

    if (ctx.language != UNKNOWN_LANGUAGE) {
        return ctx.language + " module for " + words;
    }
    return "Source file for " + words;
}

std::string summary_for(const NameContext& ctx) {
    if (const SummaryRule* rule = find_rule(ctx)) {
        return ctx.language + " " + rule->phrase;
    }
    return default_summary(ctx);
}

}  // namespace

std::vector<std::string> SummaryClassifier::relative_dir_parts(const fs::path& path,
                                                               const fs::path& root) {
    std::vector<std::string> parts;

    fs::path rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") {
        return parts;
    }

    for (const auto& component : rel.parent_path()) {
        std::string part = component.string();
        if (part.empty() || part == ".") continue;
        parts.push_back(std::move(part));
    }
    return parts;
}

NameContext SummaryClassifier::make_context(const fs::path& path, const fs::path& root) {
    return build_context(path, relative_dir_parts(path, root));
}

std::string SummaryClassifier::summarize(const fs::path& path, const fs::path& root) {
    return summary_for(make_context(path, root));
}

Classification SummaryClassifier::classify(const fs::path& path, const fs::path& root) {
    NameContext ctx = make_context(path, root);
    return Classification{ctx.language, summary_for(ctx)};
}

Classification SummaryClassifier::classify(const FileEntry& entry) {
    std::vector<std::string> parts;
    for (const auto& component : fs::path(entry.relative_path).parent_path()) {
        parts.push_back(component.string());
    }

    NameContext ctx = build_context(entry.path, std::move(parts));
    return Classification{ctx.language, summary_for(ctx)};
}

std::string SummaryClassifier::matched_rule(const fs::path& path, const fs::path& root) {
    const SummaryRule* rule = find_rule(make_context(path, root));
    return rule ? rule->id : "default";
}

std::vector<std::string> SummaryClassifier::rule_ids() {
    std::vector<std::string> ids;
    for (const auto& rule : RULES) {
        ids.emplace_back(rule.id);
    }
    ids.emplace_back("default");
    return ids;
}

}  // namespace repocat
