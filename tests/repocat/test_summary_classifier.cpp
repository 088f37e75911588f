#include <gtest/gtest.h>
#include <repocat/language_detector.hpp>
#include <repocat/summary_classifier.hpp>

#include <algorithm>

using namespace repocat;

namespace {

const fs::path ROOT = "/repo";

std::string summary_of(const std::string& relative) {
    return SummaryClassifier::summarize(ROOT / relative, ROOT);
}

}  // namespace

// ============================================================================
// Name-Based Rules
// ============================================================================

TEST(SummaryClassifierTest, EntryPointAndUtility) {
    EXPECT_EQ(summary_of("main.py"), "Python main entry point");
    EXPECT_EQ(summary_of("utils.py"), "Python utility functions");
    EXPECT_EQ(summary_of("__main__.py"), "Python main entry point");
    EXPECT_EQ(summary_of("index.js"), "JavaScript main entry point");
}

TEST(SummaryClassifierTest, ConfigNames) {
    EXPECT_EQ(summary_of("config.yaml"), "YAML configuration file");
    EXPECT_EQ(summary_of("Settings.py"), "Python configuration file");
    EXPECT_EQ(summary_of("settings"), "Unknown configuration file");
}

TEST(SummaryClassifierTest, TestNames) {
    EXPECT_EQ(summary_of("test_parser.py"), "Python test file");
    EXPECT_EQ(summary_of("parser_test.go"), "Go test file");
    EXPECT_EQ(summary_of("testing_helpers.py"), "Python test file");
    EXPECT_EQ(summary_of("tests/test_foo.py"), "Python test file");
}

TEST(SummaryClassifierTest, LayerNames) {
    EXPECT_EQ(summary_of("cli.go"), "Go command-line interface");
    EXPECT_EQ(summary_of("models.rb"), "Ruby data models");
    EXPECT_EQ(summary_of("schema.sql"), "SQL data models");
    EXPECT_EQ(summary_of("handlers.ts"), "TypeScript request handlers");
    EXPECT_EQ(summary_of("templates.html"), "HTML view templates");
    EXPECT_EQ(summary_of("services.java"), "Java service layer");
    EXPECT_EQ(summary_of("dao.kt"), "Kotlin data access layer");
}

TEST(SummaryClassifierTest, SubstringRules) {
    EXPECT_EQ(summary_of("rest_api.py"), "Python API implementation");
    EXPECT_EQ(summary_of("rapid.py"), "Python API implementation");
    EXPECT_EQ(summary_of("userdb.py"), "Python database operations");
    EXPECT_EQ(summary_of("database_setup.rb"), "Ruby database operations");
    EXPECT_EQ(summary_of("app_router.js"), "JavaScript routing configuration");
    EXPECT_EQ(summary_of("routes.php"), "PHP routing configuration");
    EXPECT_EQ(summary_of("auth_middleware.py"), "Python middleware component");
}

TEST(SummaryClassifierTest, UiComponents) {
    EXPECT_EQ(summary_of("Button.jsx"), "JavaScript UI component");
    EXPECT_EQ(summary_of("Card.tsx"), "TypeScript UI component");
    EXPECT_EQ(summary_of("header_component.py"), "Python UI component");
}

TEST(SummaryClassifierTest, ModuleInitializers) {
    EXPECT_EQ(summary_of("pkg/__init__.py"), "Python module initialization");
    EXPECT_EQ(summary_of("tests/unit/__init__.py"), "Python test module initialization");
    EXPECT_EQ(summary_of("pkg/test/__init__.py"), "Python test module initialization");
    EXPECT_EQ(summary_of("src/mod.rs"), "Rust module initialization");
}

// ============================================================================
// Rule Priority
// ============================================================================

TEST(SummaryClassifierTest, TestRuleBeatsApiRule) {
    EXPECT_EQ(summary_of("api_test.py"), "Python test file");
    EXPECT_EQ(SummaryClassifier::matched_rule(ROOT / "api_test.py", ROOT), "test");
}

TEST(SummaryClassifierTest, EntryPointBeatsComponentExtension) {
    EXPECT_EQ(summary_of("App.vue"), "Vue main entry point");
}

TEST(SummaryClassifierTest, NameRulesBeatDirectoryRules) {
    EXPECT_EQ(summary_of("src/utils.py"), "Python utility functions");
    EXPECT_EQ(summary_of("tests/test_foo.py"), "Python test file");
}

TEST(SummaryClassifierTest, RuleIdsKeepEvaluationOrder) {
    auto ids = SummaryClassifier::rule_ids();
    ASSERT_FALSE(ids.empty());
    EXPECT_EQ(ids.front(), "config");
    EXPECT_EQ(ids.back(), "default");

    auto position = [&ids](const std::string& id) {
        return std::find(ids.begin(), ids.end(), id) - ids.begin();
    };
    EXPECT_LT(position("test"), position("api"));
    EXPECT_LT(position("entry_point"), position("component"));
    EXPECT_LT(position("test_module_init"), position("module_init"));
    EXPECT_LT(position("module_init"), position("test_dir"));
}

// ============================================================================
// Directory Rules
// ============================================================================

TEST(SummaryClassifierTest, TopLevelDirectory) {
    EXPECT_EQ(summary_of("tests/conftest.py"), "Python test implementation");
    EXPECT_EQ(summary_of("Tests/fixtures/sample.py"), "Python test implementation");
    EXPECT_EQ(summary_of("src/engine.cpp"), "C++ core implementation");
    EXPECT_EQ(summary_of("lib/parser.rb"), "Ruby core implementation");
    EXPECT_EQ(summary_of("core/engine.h"), "C/C++ core implementation");
    EXPECT_EQ(summary_of("scripts/deploy.sh"), "Shell utility script");
    EXPECT_EQ(summary_of("bin/run"), "Unknown utility script");
    EXPECT_EQ(summary_of("docs/guide.md"), "Markdown documentation file");
    EXPECT_EQ(summary_of("examples/demo.py"), "Python example code");
    EXPECT_EQ(summary_of("samples/demo.go"), "Go example code");
}

TEST(SummaryClassifierTest, OnlyFirstDirectoryCounts) {
    EXPECT_EQ(summary_of("src/deep/scripts/run.py"), "Python core implementation");
    EXPECT_EQ(summary_of("vendor/src/engine.cpp"), "C++ module for engine");
}

// ============================================================================
// Default Summaries
// ============================================================================

TEST(SummaryClassifierTest, DefaultUsesLanguageAndWords) {
    EXPECT_EQ(summary_of("my_cool-module.py"), "Python module for my cool module");
    EXPECT_EQ(summary_of("contest.py"), "Python module for contest");
}

TEST(SummaryClassifierTest, DefaultForUnknownLanguage) {
    EXPECT_EQ(summary_of("Makefile"), "Source file for Makefile");
    EXPECT_EQ(summary_of("release-notes.txt"), "Source file for release notes");
    EXPECT_EQ(SummaryClassifier::matched_rule(ROOT / "Makefile", ROOT), "default");
}

TEST(SummaryClassifierTest, PathOutsideRootHasNoDirectoryContext) {
    EXPECT_EQ(SummaryClassifier::summarize("/elsewhere/src/engine.cpp", ROOT),
              "C++ module for engine");
    EXPECT_EQ(SummaryClassifier::summarize("/elsewhere/tests/__init__.py", ROOT),
              "Python module initialization");
}

// ============================================================================
// Properties
// ============================================================================

TEST(SummaryClassifierTest, TotalAndMentionsLanguage) {
    const char* paths[] = {
        "main.py", "a.rs", "tests/x.go", "src/y.h", "docs/z.md", "api_test.py",
        "Makefile", "LICENSE", ".gitignore", "weird..name.", "x", "deep/a/b/c/d.cs",
        "pkg/__init__.py", "Component.vue", "db.sql", "scripts/tool",
    };

    for (const char* relative : paths) {
        fs::path path = ROOT / relative;
        std::string language = LanguageDetector::detect(path);
        std::string summary = SummaryClassifier::summarize(path, ROOT);

        EXPECT_FALSE(summary.empty()) << relative;
        if (SummaryClassifier::matched_rule(path, ROOT) != "default" ||
            language != UNKNOWN_LANGUAGE) {
            EXPECT_NE(summary.find(language), std::string::npos) << relative;
        }
    }
}

TEST(SummaryClassifierTest, Deterministic) {
    fs::path path = ROOT / "services" / "payment_api.py";
    std::string first = SummaryClassifier::summarize(path, ROOT);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(SummaryClassifier::summarize(path, ROOT), first);
    }
}

TEST(SummaryClassifierTest, RelativeDirParts) {
    auto parts = SummaryClassifier::relative_dir_parts("/repo/a/b/c.py", ROOT);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");

    EXPECT_TRUE(SummaryClassifier::relative_dir_parts("/repo/c.py", ROOT).empty());
    EXPECT_TRUE(SummaryClassifier::relative_dir_parts("/other/x/c.py", ROOT).empty());

    auto relative = SummaryClassifier::relative_dir_parts("pkg/mod.py", ".");
    ASSERT_EQ(relative.size(), 1u);
    EXPECT_EQ(relative[0], "pkg");
}

TEST(SummaryClassifierTest, ClassifyEntryUsesRelativePath) {
    FileEntry entry;
    entry.path = "/repo/tests/unit/__init__.py";
    entry.relative_path = "tests/unit/__init__.py";
    entry.name = "__init__.py";
    entry.extension = ".py";

    Classification c = SummaryClassifier::classify(entry);
    EXPECT_EQ(c.language, "Python");
    EXPECT_EQ(c.summary, "Python test module initialization");
}
