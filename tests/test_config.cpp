#include <catch2/catch_all.hpp>
#include <fieldmerge/Config.hpp>
#include <fieldmerge/Updater.hpp>
#include <fieldmerge/Util.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace fieldmerge;
using nlohmann::json;

TEST_CASE("builtin defaults") {
    Config cfg = Config::load(LoadOptions{});
    REQUIRE(cfg.at("merge.prune_dangling").get<bool>() == false);
    REQUIRE(cfg.at("output.indent").get<int>() == 2);
    REQUIRE(cfg.at("output.format").get<std::string>() == "json");
}

TEST_CASE("load JSON") {
    std::string path = "tmp_fieldmerge_cfg.json";
    json j = {{"merge", {{"prune_dangling", true}}}};
    std::ofstream(path) << j.dump(2);
    LoadOptions opts;
    opts.file_path = path;
    Config cfg = Config::load(opts);
    REQUIRE(cfg.at("merge.prune_dangling").get<bool>() == true);
    REQUIRE(cfg.at("output.indent").get<int>() == 2);
    std::remove(path.c_str());
}

TEST_CASE("load TOML") {
    std::string path = "tmp_fieldmerge_cfg.toml";
    std::ofstream(path) << "[output]\nindent = 4\nformat = \"toml\"\n";
    LoadOptions opts;
    opts.file_path = path;
    Config cfg = Config::load(opts);
    REQUIRE(cfg.at("output.indent").get<int>() == 4);
    REQUIRE(cfg.at("output.format").get<std::string>() == "toml");
    REQUIRE(cfg.at("merge.prune_dangling").get<bool>() == false);
    std::remove(path.c_str());
}

TEST_CASE("env override") {
    setenv("FIELDMERGE_CFGTEST_MERGE_PRUNE_DANGLING", "true", 1);
    setenv("FIELDMERGE_CFGTEST_OUTPUT_INDENT", "8", 1);
    LoadOptions opts;
    opts.prefix = "FIELDMERGE_CFGTEST";
    Config cfg = Config::load(opts);
    REQUIRE(cfg.at("merge.prune_dangling").get<bool>() == true);
    REQUIRE(cfg.at("output.indent").get<int>() == 8);
    unsetenv("FIELDMERGE_CFGTEST_MERGE_PRUNE_DANGLING");
    unsetenv("FIELDMERGE_CFGTEST_OUTPUT_INDENT");
}

TEST_CASE("env prefix with trailing underscore") {
    setenv("FIELDMERGE_CFGTRAIL_OUTPUT_FORMAT", "toml", 1);
    LoadOptions opts;
    opts.prefix = "FIELDMERGE_CFGTRAIL_";
    Config cfg = Config::load(opts);
    REQUIRE(cfg.at("output.format").get<std::string>() == "toml");
    unsetenv("FIELDMERGE_CFGTRAIL_OUTPUT_FORMAT");
}

TEST_CASE("overrides beat env") {
    setenv("FIELDMERGE_CFGPREC_OUTPUT_INDENT", "8", 1);
    LoadOptions opts;
    opts.prefix = "FIELDMERGE_CFGPREC";
    opts.overrides = parse_overrides("output.indent:0");
    Config cfg = Config::load(opts);
    REQUIRE(cfg.at("output.indent").get<int>() == 0);
    unsetenv("FIELDMERGE_CFGPREC_OUTPUT_INDENT");
}

TEST_CASE("defaults and mandatory") {
    LoadOptions opts;
    opts.defaults = json{{"state", json::object()}};
    opts.mandatory = {"state.path"};
    REQUIRE_THROWS_AS(Config::load(opts), MissingMandatoryConfig);

    opts.defaults = json{{"state", {{"path", "state.json"}}}};
    Config cfg = Config::load(opts);
    REQUIRE(cfg.at("state.path").get<std::string>() == "state.json");
}

TEST_CASE("missing key access") {
    Config cfg = Config::load(LoadOptions{});
    REQUIRE_FALSE(cfg.contains("output.color"));
    REQUIRE_THROWS_AS(cfg.at("output.color"), KeyError);
}

TEST_CASE("typed get falls back") {
    Config cfg(json{{"merge", {{"prune_dangling", "sometimes"}}}});
    REQUIRE(cfg.get<bool>("merge.prune_dangling", true) == true);
    REQUIRE(cfg.get<int>("output.indent", 3) == 3);
    cfg.set("output.indent", 5);
    REQUIRE(cfg.get<int>("output.indent", 3) == 5);
}

TEST_CASE("toml rendering") {
    Config cfg = Config::load(LoadOptions{});
    std::string toml = cfg.to_toml_string();
    REQUIRE_THAT(toml, Catch::Matchers::ContainsSubstring("[merge]"));
    REQUIRE_THAT(toml, Catch::Matchers::ContainsSubstring("prune_dangling = false"));

    std::string wrapped = Config::render_toml(json::array({1, 2}));
    REQUIRE_THAT(wrapped, Catch::Matchers::ContainsSubstring("value = "));
}

TEST_CASE("toml rendering of nested objects") {
    json doc = json::parse(R"({"object":{"numeric":1,"gone":null},"ports":[{"name":"http","port":80}]})");
    std::string toml = Config::render_toml(doc);
    REQUIRE_THAT(toml, Catch::Matchers::ContainsSubstring("[object]"));
    REQUIRE_THAT(toml, Catch::Matchers::ContainsSubstring("numeric = 1"));
    REQUIRE_THAT(toml, Catch::Matchers::ContainsSubstring("gone = "));
    REQUIRE_THAT(toml, Catch::Matchers::ContainsSubstring("port = 80"));
}

TEST_CASE("updater options from config") {
    REQUIRE(UpdaterOptions::from_config(Config::load(LoadOptions{})).prune_dangling == false);

    LoadOptions opts;
    opts.overrides = {{"merge.prune_dangling", true}};
    REQUIRE(UpdaterOptions::from_config(Config::load(opts)).prune_dangling == true);
}
