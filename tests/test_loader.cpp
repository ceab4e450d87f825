/**
 * @file test_loader.cpp
 * @brief Tests for file loading utilities
 *
 * Tests cover:
 * - JSON file loading and parse error positions
 * - TOML file loading
 * - Auto-detect file loading by extension
 */

#include <catch2/catch_all.hpp>
#include "fieldmerge/Loader.hpp"
#include "fieldmerge/Errors.hpp"

#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

using namespace fieldmerge;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("fieldmerge_test_" + std::to_string(std::rand()) + extension)) {
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

// ============================================================================
// JSON File Loading Tests
// ============================================================================

TEST_CASE("load_json_file - basic loading", "[loader][json]") {
    SECTION("Nested JSON object") {
        TempFile file(R"({
            "merge": {"prune_dangling": true},
            "output": {"indent": 4}
        })");

        Value result = load_json_file(file.path());

        CHECK(result["merge"]["prune_dangling"] == true);
        CHECK(result["output"]["indent"] == 4);
    }

    SECTION("JSON with arrays and nulls") {
        TempFile file(R"({"ports": [{"name": "http", "port": 80}], "nullable": null})");

        Value result = load_json_file(file.path());

        CHECK(result["ports"].is_array());
        CHECK(result["ports"][0]["port"] == 80);
        CHECK(result["nullable"].is_null());
    }

    SECTION("Top-level array is allowed") {
        TempFile file("[1, 2, 3]");
        CHECK(load_json_file(file.path()).size() == 3);
    }
}

TEST_CASE("load_json_file - error handling", "[loader][json]") {
    SECTION("File not found throws FileNotFoundError") {
        try {
            load_json_file("/nonexistent/path.json");
            FAIL("expected FileNotFoundError");
        } catch (const FileNotFoundError& e) {
            CHECK(e.path() == "/nonexistent/path.json");
        }
    }

    SECTION("Invalid JSON throws ParseError") {
        TempFile file("{ invalid json }");
        CHECK_THROWS_AS(load_json_file(file.path()), ParseError);
    }

    SECTION("ParseError carries the line and column") {
        TempFile file("{\n  \"a\": ,\n}");
        try {
            load_json_file(file.path());
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            CHECK(e.file() == file.path());
            CHECK(e.line() == 2);
            CHECK(e.column() == 8);
            CHECK_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("at 2:8"));
        }
    }

    SECTION("ParseError is a ConfigError") {
        TempFile file(R"({"key": "value)");
        CHECK_THROWS_AS(load_json_file(file.path()), ConfigError);
    }
}

// ============================================================================
// TOML File Loading Tests
// ============================================================================

TEST_CASE("load_toml_file - basic loading", "[loader][toml]") {
    SECTION("Tables become nested objects") {
        TempFile file(R"(
[merge]
prune_dangling = true

[output]
indent = 4
format = "toml"
)", ".toml");

        Value result = load_toml_file(file.path());

        CHECK(result["merge"]["prune_dangling"] == true);
        CHECK(result["output"]["indent"] == 4);
        CHECK(result["output"]["format"] == "toml");
    }

    SECTION("Arrays of tables") {
        TempFile file(R"(
[[types]]
name = "port"

[[types]]
name = "service"
)", ".toml");

        Value result = load_toml_file(file.path());

        REQUIRE(result["types"].is_array());
        CHECK(result["types"].size() == 2);
        CHECK(result["types"][1]["name"] == "service");
    }

    SECTION("Floats and dates") {
        TempFile file("ratio = 0.5\nday = 2024-01-15\n", ".toml");

        Value result = load_toml_file(file.path());

        CHECK(result["ratio"].get<double>() == Catch::Approx(0.5));
        CHECK(result["day"] == "2024-01-15");
    }
}

TEST_CASE("load_toml_file - error handling", "[loader][toml]") {
    SECTION("File not found") {
        CHECK_THROWS_AS(load_toml_file("/nonexistent/path.toml"), FileNotFoundError);
    }

    SECTION("Invalid TOML throws ParseError with a position") {
        TempFile file("key = \n", ".toml");
        try {
            load_toml_file(file.path());
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            CHECK(e.line() >= 1);
        }
    }
}

// ============================================================================
// Auto-detect File Loading Tests
// ============================================================================

TEST_CASE("load_config_file - auto-detection", "[loader]") {
    SECTION("Empty path yields empty object") {
        Value result = load_config_file("");
        CHECK(result.is_object());
        CHECK(result.empty());
    }

    SECTION("Dispatches on extension, case-insensitively") {
        TempFile json_file(R"({"a": 1})", ".JSON");
        TempFile toml_file("a = 2\n", ".toml");

        CHECK(load_config_file(json_file.path())["a"] == 1);
        CHECK(load_config_file(toml_file.path())["a"] == 2);
    }

    SECTION("Unsupported extension throws ConfigError") {
        TempFile file("a: 1\n", ".yaml");
        CHECK_THROWS_AS(load_config_file(file.path()), ConfigError);
    }

    SECTION("Missing file throws FileNotFoundError before extension check") {
        CHECK_THROWS_AS(load_config_file("/nonexistent/file.yaml"), FileNotFoundError);
    }
}

TEST_CASE("get_file_extension", "[loader]") {
    CHECK(get_file_extension("state.json") == ".json");
    CHECK(get_file_extension("/tmp/Schema.TOML") == ".toml");
    CHECK(get_file_extension("noext") == "");
}
