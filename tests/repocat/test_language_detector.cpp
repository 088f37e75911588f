#include <gtest/gtest.h>
#include <repocat/language_detector.hpp>
#include <repocat/types.hpp>

#include <algorithm>

using namespace repocat;

// ============================================================================
// Extension Lookup
// ============================================================================

TEST(LanguageDetectorTest, CommonExtensions) {
    EXPECT_EQ(LanguageDetector::detect("main.py"), "Python");
    EXPECT_EQ(LanguageDetector::detect("lib.rs"), "Rust");
    EXPECT_EQ(LanguageDetector::detect("app.tsx"), "TypeScript");
    EXPECT_EQ(LanguageDetector::detect("widget.jsx"), "JavaScript");
    EXPECT_EQ(LanguageDetector::detect("Main.java"), "Java");
    EXPECT_EQ(LanguageDetector::detect("module.c"), "C");
    EXPECT_EQ(LanguageDetector::detect("engine.cc"), "C++");
    EXPECT_EQ(LanguageDetector::detect("Program.cs"), "C#");
    EXPECT_EQ(LanguageDetector::detect("deploy.ps1"), "PowerShell");
    EXPECT_EQ(LanguageDetector::detect("README.rst"), "reStructuredText");
    EXPECT_EQ(LanguageDetector::detect("setup.cfg"), "Config");
    EXPECT_EQ(LanguageDetector::detect("nginx.conf"), "Config");
}

TEST(LanguageDetectorTest, HeaderIsAlwaysCompositeLabel) {
    EXPECT_EQ(LanguageDetector::detect("stdio.h"), "C/C++");
    EXPECT_EQ(LanguageDetector::detect("include/vector.h"), "C/C++");
    EXPECT_EQ(LanguageDetector::detect("widget.hpp"), "C++");
}

TEST(LanguageDetectorTest, ExtensionIsCaseInsensitive) {
    EXPECT_EQ(LanguageDetector::detect("SCRIPT.PY"), "Python");
    EXPECT_EQ(LanguageDetector::detect("Analysis.R"), "R");
    EXPECT_EQ(LanguageDetector::detect("Config.YAML"), "YAML");
}

TEST(LanguageDetectorTest, UnknownExtensions) {
    EXPECT_EQ(LanguageDetector::detect("Makefile"), UNKNOWN_LANGUAGE);
    EXPECT_EQ(LanguageDetector::detect("archive.tar.gz"), UNKNOWN_LANGUAGE);
    EXPECT_EQ(LanguageDetector::detect("start.s"), UNKNOWN_LANGUAGE);
    EXPECT_EQ(LanguageDetector::detect(".gitignore"), UNKNOWN_LANGUAGE);
    EXPECT_EQ(LanguageDetector::detect("trailing."), UNKNOWN_LANGUAGE);
    EXPECT_EQ(LanguageDetector::detect(""), UNKNOWN_LANGUAGE);
}

TEST(LanguageDetectorTest, OnlyFinalComponentMatters) {
    EXPECT_EQ(LanguageDetector::detect("src.py/README"), UNKNOWN_LANGUAGE);
    EXPECT_EQ(LanguageDetector::detect("dir.d/tool.go"), "Go");
}

TEST(LanguageDetectorTest, SameExtensionSameLanguage) {
    const char* paths[] = {"a.rb", "deep/nested/path/b.rb", "tests/test_c.rb", "CamelCase.rb"};
    for (const char* path : paths) {
        EXPECT_EQ(LanguageDetector::detect(path), "Ruby") << path;
    }
}

// ============================================================================
// Name Splitting
// ============================================================================

TEST(LanguageDetectorTest, ExtensionOf) {
    EXPECT_EQ(LanguageDetector::extension_of("main.PY"), ".py");
    EXPECT_EQ(LanguageDetector::extension_of("archive.tar.gz"), ".gz");
    EXPECT_EQ(LanguageDetector::extension_of("Makefile"), "");
    EXPECT_EQ(LanguageDetector::extension_of(".bashrc"), "");
    EXPECT_EQ(LanguageDetector::extension_of("name."), "");
}

TEST(LanguageDetectorTest, StemOf) {
    EXPECT_EQ(LanguageDetector::stem_of("My_Module.py"), "My_Module");
    EXPECT_EQ(LanguageDetector::stem_of("archive.tar.gz"), "archive.tar");
    EXPECT_EQ(LanguageDetector::stem_of("Makefile"), "Makefile");
    EXPECT_EQ(LanguageDetector::stem_of(".bashrc"), ".bashrc");
}

TEST(LanguageDetectorTest, TableIsSortedAndComplete) {
    auto table = LanguageDetector::table();
    ASSERT_FALSE(table.empty());
    EXPECT_TRUE(std::is_sorted(table.begin(), table.end()));

    for (const auto& [extension, language] : table) {
        EXPECT_EQ(extension.front(), '.');
        EXPECT_EQ(LanguageDetector::detect("file" + extension), language) << extension;
    }
}
