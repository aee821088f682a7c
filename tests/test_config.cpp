#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <iterator>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace hookcache;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: built-in caches", "[config]") {
    Config cfg;
    REQUIRE(cfg.caches.size() == 2);

    auto& exploration = cfg.caches.at("exploration");
    REQUIRE(exploration.ttl_seconds == 3600);
    REQUIRE(exploration.max_entries == 50);
    REQUIRE(exploration.similarity_threshold == 0.6);
    REQUIRE(exploration.fuzzy_match);

    auto& research = cfg.caches.at("research");
    REQUIRE(research.ttl_seconds == 86400);
    REQUIRE(research.max_content_size == 50000);
    REQUIRE_FALSE(research.fuzzy_match);
}

TEST_CASE("Config::cache: resolves snapshot path under data_dir", "[config]") {
    Config cfg;
    cfg.data_dir = "/var/tmp/hc";

    auto settings = cfg.cache("research");
    REQUIRE(settings.has_value());
    REQUIRE(settings.value_or(CacheSettings{}).path == "/var/tmp/hc/cache/research.json");
    REQUIRE(settings.value_or(CacheSettings{}).name == "research");
}

TEST_CASE("Config::cache: explicit path kept", "[config]") {
    Config cfg;
    cfg.caches["exploration"].path = "/srv/explore.json";
    REQUIRE(cfg.cache("exploration").value_or(CacheSettings{}).path == "/srv/explore.json");
}

TEST_CASE("Config::cache: unknown name", "[config]") {
    Config cfg;
    REQUIRE_FALSE(cfg.cache("nope").has_value());
}

TEST_CASE("cache_settings_from_json: wrong types keep base values", "[config]") {
    CacheSettings base;
    base.ttl_seconds = 10;
    auto s = cache_settings_from_json("x", nlohmann::json{
        {"ttl_seconds", "soon"},
        {"max_entries", -3},
        {"similarity_threshold", 0.8},
        {"fuzzy_match", false}
    }, base);

    REQUIRE(s.name == "x");
    REQUIRE(s.ttl_seconds == 10);
    REQUIRE(s.max_entries == 50);
    REQUIRE(s.similarity_threshold == 0.8);
    REQUIRE_FALSE(s.fuzzy_match);
}

TEST_CASE("cache_settings_from_json: values past 32 bits keep base values", "[config]") {
    CacheSettings base;
    auto s = cache_settings_from_json("x", nlohmann::json{
        {"ttl_seconds", 4294967396ULL},
        {"max_entries", 4294967295ULL}
    }, base);

    REQUIRE(s.ttl_seconds == 3600);
    REQUIRE(s.max_entries == 4294967295u);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "hookcache_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("HOOKCACHE_DATA_DIR");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.hookcache/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.hookcache");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "data_dir": "/data/hooks",
        "caches": {
            "exploration": { "ttl_seconds": 600, "max_entries": 20, "similarity_threshold": 0.75 },
            "research": { "fuzzy_match": true, "path": "/data/research.json" },
            "builds": { "ttl_seconds": 120, "fuzzy_match": false }
        }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.data_dir == "/data/hooks");
    auto exploration = cfg.cache("exploration").value_or(CacheSettings{});
    REQUIRE(exploration.ttl_seconds == 600);
    REQUIRE(exploration.max_entries == 20);
    REQUIRE(exploration.similarity_threshold == 0.75);
    REQUIRE(exploration.max_result_chars == 500);
    REQUIRE(exploration.path == "/data/hooks/cache/exploration.json");

    auto research = cfg.cache("research").value_or(CacheSettings{});
    REQUIRE(research.fuzzy_match);
    REQUIRE(research.ttl_seconds == 86400);
    REQUIRE(research.path == "/data/research.json");

    auto builds = cfg.cache("builds");
    REQUIRE(builds.has_value());
    REQUIRE(builds.value_or(CacheSettings{}).ttl_seconds == 120);
    REQUIRE_FALSE(builds.value_or(CacheSettings{}).fuzzy_match);
}

TEST_CASE("Config::load: env var overrides data_dir", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"data_dir": "/from/file"})");
    setenv("HOOKCACHE_DATA_DIR", "/from/env", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.data_dir == "/from/env");
    REQUIRE(cfg.cache("exploration").value_or(CacheSettings{}).path ==
            "/from/env/cache/exploration.json");

    unsetenv("HOOKCACHE_DATA_DIR");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.data_dir.empty());
    REQUIRE(cfg.caches.at("exploration").ttl_seconds == 3600);
}

TEST_CASE("Config::load: missing config uses defaults under HOME", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.resolved_data_dir() == g.dir + "/.hookcache/data");
    REQUIRE(cfg.cache("research").value_or(CacheSettings{}).path ==
            g.dir + "/.hookcache/data/cache/research.json");
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j.contains("data_dir"));
    REQUIRE(j.contains("caches"));
    REQUIRE(j["caches"]["exploration"]["ttl_seconds"] == 3600);
    REQUIRE(j["caches"]["exploration"]["fuzzy_match"] == true);
    REQUIRE(j["caches"]["research"]["ttl_seconds"] == 86400);
    REQUIRE(j["caches"]["research"]["fuzzy_match"] == false);
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"caches": {"exploration": {"max_entries": 7}}})");

    Config cfg = Config::load();
    REQUIRE(cfg.caches.at("exploration").max_entries == 7);

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j["caches"]["exploration"]["max_entries"] == 7);
    REQUIRE(j["caches"]["exploration"]["ttl_seconds"] == 3600);
    REQUIRE(j["caches"].contains("research"));
    REQUIRE(j.contains("data_dir"));
}

TEST_CASE("Config::load: defaults roundtrip without re-migration", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    std::string first = g.read_config();

    Config::load();
    std::string second = g.read_config();

    REQUIRE(first == second);
}
