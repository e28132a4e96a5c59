/**
 * @file test_settings.cpp
 * @brief Tests for layered tool settings (Catch2)
 *
 * Tests cover:
 * - JSON and TOML settings files
 * - The "output" section overriding root keys
 * - PREFIX_* environment variables
 * - Precedence: defaults -> file -> environment
 */

#include <catch2/catch_all.hpp>
#include "mergepatch/Settings.hpp"
#include "mergepatch/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>

namespace fs = std::filesystem;

using namespace mergepatch;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension)
        : path_(fs::temp_directory_path() /
                ("mergepatch_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

/**
 * @brief RAII helper for environment variables.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::string& value)
        : name_(name) {
        if (const char* old = std::getenv(name.c_str())) {
            original_ = old;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvVar() {
        if (original_.has_value()) {
            setenv(name_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> original_;
};

// ============================================================================
// Settings files
// ============================================================================

TEST_CASE("load_settings_file - formats", "[settings][file]") {
    SECTION("JSON file") {
        TempFile file(R"({"escape_html": false, "indent": 2})", ".json");
        Value settings = load_settings_file(file.path());
        CHECK(settings["escape_html"] == false);
        CHECK(settings["indent"] == 2);
    }

    SECTION("TOML file") {
        TempFile file("max_depth = 64\n\n[output]\nescape_html = false\n", ".toml");
        Value settings = load_settings_file(file.path());
        CHECK(settings["max_depth"] == 64);
        CHECK(settings["output"]["escape_html"] == false);
    }
}

TEST_CASE("load_settings_file - TOML value types", "[settings][file]") {
    SECTION("Unrelated keys of other types are ignored") {
        TempFile file("created = 2024-01-02T03:04:05Z\ntags = [\"a\"]\nindent = 4\n", ".toml");
        ApplyOptions opts;
        apply_settings(opts, load_settings_file(file.path()), file.path());
        CHECK(opts.indent == 4);
    }

    SECTION("A string where a boolean is expected is rejected") {
        TempFile file("escape_html = \"no\"\n", ".toml");
        ApplyOptions opts;
        REQUIRE_THROWS_AS(apply_settings(opts, load_settings_file(file.path()), file.path()),
                          ConfigParseError);
    }

    SECTION("A date where an integer is expected is rejected") {
        TempFile file("[output]\nmax_depth = 2024-01-02\n", ".toml");
        ApplyOptions opts;
        REQUIRE_THROWS_AS(apply_settings(opts, load_settings_file(file.path()), file.path()),
                          ConfigParseError);
    }
}

TEST_CASE("load_settings_file - errors", "[settings][file]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(load_settings_file("/nonexistent/mergepatch.toml"), FileNotFoundError);
    }

    SECTION("Invalid JSON") {
        TempFile file(R"({"indent": })", ".json");
        REQUIRE_THROWS_AS(load_settings_file(file.path()), ConfigParseError);
    }

    SECTION("Invalid TOML") {
        TempFile file("indent = = 2\n", ".toml");
        REQUIRE_THROWS_AS(load_settings_file(file.path()), ConfigParseError);
    }

    SECTION("Unsupported extension") {
        TempFile file("indent: 2\n", ".yaml");
        REQUIRE_THROWS_AS(load_settings_file(file.path()), ConfigParseError);
    }
}

// ============================================================================
// Overlays
// ============================================================================

TEST_CASE("apply_settings - recognised keys", "[settings]") {
    ApplyOptions opts;

    SECTION("Root keys") {
        apply_settings(opts, Value{{"escape_html", false}, {"indent", 2}, {"max_depth", 10}}, "test");
        CHECK_FALSE(opts.escape_html);
        CHECK(opts.indent == 2);
        CHECK(opts.max_depth == 10);
    }

    SECTION("Output section wins over root") {
        Value settings = {{"indent", 2}, {"output", {{"indent", 4}}}};
        apply_settings(opts, settings, "test");
        CHECK(opts.indent == 4);
    }

    SECTION("Unknown keys are ignored") {
        apply_settings(opts, Value{{"colour", "blue"}}, "test");
        CHECK(opts.escape_html);
        CHECK(opts.indent == -1);
        CHECK(opts.max_depth == kDefaultMaxDepth);
    }
}

TEST_CASE("apply_settings - invalid values", "[settings]") {
    ApplyOptions opts;

    REQUIRE_THROWS_AS(apply_settings(opts, Value{{"escape_html", "no"}}, "test"), ConfigParseError);
    REQUIRE_THROWS_AS(apply_settings(opts, Value{{"indent", -2}}, "test"), ConfigParseError);
    REQUIRE_THROWS_AS(apply_settings(opts, Value{{"max_depth", 0}}, "test"), ConfigParseError);
    REQUIRE_THROWS_AS(apply_settings(opts, Value{{"max_depth", 1.5}}, "test"), ConfigParseError);
    REQUIRE_THROWS_AS(apply_settings(opts, Value{{"output", 3}}, "test"), ConfigParseError);
    REQUIRE_THROWS_AS(apply_settings(opts, Value::array(), "test"), ConfigParseError);
}

TEST_CASE("apply_env_settings", "[settings][env]") {
    ApplyOptions opts;

    SECTION("Typed values") {
        ScopedEnvVar escape("MPTEST_ESCAPE_HTML", "FALSE");
        ScopedEnvVar indent("MPTEST_INDENT", "3");
        apply_env_settings(opts, "MPTEST");
        CHECK_FALSE(opts.escape_html);
        CHECK(opts.indent == 3);
        CHECK(opts.max_depth == kDefaultMaxDepth);
    }

    SECTION("Bad value names the variable") {
        ScopedEnvVar depth("MPTEST_MAX_DEPTH", "deep");
        try {
            apply_env_settings(opts, "MPTEST");
            FAIL("expected ConfigParseError");
        } catch (const ConfigParseError& e) {
            CHECK(e.source() == "MPTEST_MAX_DEPTH");
        }
    }
}

TEST_CASE("load_options - precedence", "[settings]") {
    TempFile file("indent = 2\nmax_depth = 50\n", ".toml");

    SECTION("File over defaults") {
        ApplyOptions opts = load_options(file.path(), "MPTEST");
        CHECK(opts.indent == 2);
        CHECK(opts.max_depth == 50);
        CHECK(opts.escape_html);
    }

    SECTION("Environment over file") {
        ScopedEnvVar indent("MPTEST_INDENT", "-1");
        ApplyOptions opts = load_options(file.path(), "MPTEST");
        CHECK(opts.indent == -1);
        CHECK(opts.max_depth == 50);
    }

    SECTION("No file") {
        ApplyOptions opts = load_options(std::nullopt, "MPTEST");
        CHECK(opts.indent == -1);
    }
}
