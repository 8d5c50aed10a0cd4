#include <catch2/catch_test_macros.hpp>

#include <cinegraph/config/config_loader.hpp>

#include <map>
#include <string>
#include <vector>

using namespace cinegraph;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

// Environment backed by a map, so tests never touch the process environment.
EnvLookup FakeEnv(const std::map<std::string, std::string>& vars) {
    return [vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

Result<AppConfig, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "cinegraph");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.store.uri == "http://neo4j.example.com:7474");
    CHECK(config.store.database == "movies");
    CHECK(config.store.user == "reader");
    CHECK(config.store.password.empty());
    REQUIRE(config.store.password_env.has_value());
    CHECK(*config.store.password_env == "MOVIES_DB_PASSWORD");
    CHECK(config.store.pool_size == 16);
    CHECK(config.store.acquire_timeout_ms == 5000);

    CHECK(config.ranking.genre_weight == 1.5);
    CHECK(config.ranking.actor_weight == 4.0);
    CHECK(config.ranking.default_limit == 10);

    REQUIRE(config.requests.size() == 2);
    CHECK(config.requests[0].title == "Inception");
    CHECK(config.requests[0].strategy == "combined");
    CHECK(config.requests[0].limit == 3);
    CHECK(config.requests[1].title == "Titanic");
    CHECK(config.requests[1].strategy == "cast");
    CHECK_FALSE(config.requests[1].limit.has_value());

    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "cinegraph.log");
    CHECK(config.timeout_ms == 15000);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.store.uri == "http://localhost:7474");
    CHECK(config.store.database == "neo4j");
    CHECK(config.store.pool_size == 8);
    CHECK(config.ranking == RankingPolicy{});
    REQUIRE(config.requests.size() == 1);
    CHECK(config.requests[0].strategy == "combined");
    CHECK(config.timeout_ms == 30000);
}

TEST_CASE("LoadFromYaml: error cases", "[config][yaml]") {
    SECTION("missing file") {
        auto r = LoadFromYaml(TestDataPath("nope.yaml"));
        REQUIRE(r.IsErr());
        CHECK(r.Error().operation == "ConfigLoader");
        CHECK(r.Error().category == ErrorCategory::InvalidArgument);
    }
    SECTION("malformed YAML") {
        auto r = LoadFromYaml(TestDataPath("malformed.yaml"));
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("Failed to parse YAML") != std::string::npos);
    }
    SECTION("wrong value type") {
        auto r = LoadFromYaml(TestDataPath("invalid_type_config.yaml"));
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("Invalid value") != std::string::npos);
    }
    SECTION("unknown strategy") {
        auto r = LoadFromYaml(TestDataPath("invalid_strategy_config.yaml"));
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("popularity") != std::string::npos);
    }
    SECTION("request without title") {
        auto r = LoadFromYaml(TestDataPath("missing_title_config.yaml"));
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Request entry missing 'title' field");
    }
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: single request", "[config][cli]") {
    auto r = ParseArgs({"--title", "Inception", "--strategy", "cast", "--limit", "3"});
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().requests.size() == 1);
    const auto& request = r.Value().requests[0];
    CHECK(request.title == "Inception");
    CHECK(request.strategy == "cast");
    CHECK(request.limit == 3);
}

TEST_CASE("LoadFromCli: store flags", "[config][cli]") {
    auto r = ParseArgs({"--uri", "https://graph.internal", "--database", "films",
                        "--user", "reader", "--password-env", "FILMS_PW",
                        "--pool-size", "4", "--insecure", "--timeout", "2000", "--json"});
    REQUIRE(r.IsOk());
    const auto& config = r.Value();
    CHECK(config.store.uri == "https://graph.internal");
    CHECK(config.store.database == "films");
    CHECK(config.store.user == "reader");
    CHECK(config.store.password_env == std::string("FILMS_PW"));
    CHECK(config.store.pool_size == 4);
    CHECK(config.store.disable_tls_verify);
    CHECK(config.timeout_ms == 2000);
    CHECK(config.json_output);
    CHECK(config.requests.empty());
}

TEST_CASE("LoadFromCli: offline dataset", "[config][cli]") {
    auto r = ParseArgs({"--offline", "movies.yaml", "--title", "Heat"});
    REQUIRE(r.IsOk());
    CHECK(r.Value().store.offline_dataset == std::string("movies.yaml"));
}

TEST_CASE("LoadFromCli: rejects bad input", "[config][cli]") {
    CHECK(ParseArgs({"--title", "Heat", "--strategy", "popularity"}).IsErr());
    CHECK(ParseArgs({"--title", "   "}).IsErr());
    CHECK(ParseArgs({"--limit", "three"}).IsErr());
    CHECK(ParseArgs({"--no-such-flag"}).IsErr());
}

// ===========================================================================
// LoadFromEnv
// ===========================================================================

TEST_CASE("LoadFromEnv: reads the NEO4J_* variables", "[config][env]") {
    auto config = LoadFromEnv(FakeEnv({{"NEO4J_URI", "http://db:7474"},
                                       {"NEO4J_USERNAME", "reader"},
                                       {"NEO4J_PASSWORD", "secret"},
                                       {"NEO4J_DATABASE", "movies"}}));
    CHECK(config.store.uri == "http://db:7474");
    CHECK(config.store.user == "reader");
    CHECK(config.store.password == "secret");
    CHECK(config.store.database == "movies");
}

TEST_CASE("LoadFromEnv: unset variables keep defaults", "[config][env]") {
    auto config = LoadFromEnv(FakeEnv({}));
    CHECK(config.store.uri == "http://localhost:7474");
    CHECK(config.store.user == "neo4j");
    CHECK(config.store.password.empty());
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: non-default overrides win", "[config][merge]") {
    AppConfig base;
    base.store.uri = "http://yaml-host:7474";
    base.store.pool_size = 16;
    base.ranking.default_limit = 10;
    base.requests.push_back({"Inception", "combined", std::nullopt});

    AppConfig overrides;
    overrides.store.uri = "http://flag-host:7474";
    overrides.timeout_ms = 1000;

    auto merged = MergeConfigs(base, overrides);
    CHECK(merged.store.uri == "http://flag-host:7474");
    CHECK(merged.store.pool_size == 16);
    CHECK(merged.ranking.default_limit == 10);
    CHECK(merged.timeout_ms == 1000);
    REQUIRE(merged.requests.size() == 1);
}

TEST_CASE("MergeConfigs: requests from overrides replace the list", "[config][merge]") {
    AppConfig base;
    base.requests.push_back({"Inception", "combined", std::nullopt});
    base.requests.push_back({"Titanic", "cast", std::nullopt});
    AppConfig overrides;
    overrides.requests.push_back({"Heat", "genre", 2});

    auto merged = MergeConfigs(base, overrides);
    REQUIRE(merged.requests.size() == 1);
    CHECK(merged.requests[0].title == "Heat");
}

TEST_CASE("MergeConfigs: defaults < yaml < env < flags", "[config][merge]") {
    AppConfig yaml;
    yaml.store.uri = "http://yaml:7474";
    yaml.store.user = "yaml-user";
    auto env = LoadFromEnv(FakeEnv({{"NEO4J_URI", "http://env:7474"}}));
    AppConfig flags;
    flags.store.user = "flag-user";

    auto merged = MergeConfigs(MergeConfigs(yaml, env), flags);
    CHECK(merged.store.uri == "http://env:7474");
    CHECK(merged.store.user == "flag-user");
}

// ===========================================================================
// ResolvePasswordEnv
// ===========================================================================

TEST_CASE("ResolvePasswordEnv: reads the named variable", "[config][password]") {
    AppConfig config;
    config.store.password_env = "MOVIES_DB_PASSWORD";
    auto r = ResolvePasswordEnv(config, FakeEnv({{"MOVIES_DB_PASSWORD", "hunter2"}}));
    REQUIRE(r.IsOk());
    CHECK(r.Value().store.password == "hunter2");
}

TEST_CASE("ResolvePasswordEnv: unset variable is an error", "[config][password]") {
    AppConfig config;
    config.store.password_env = "MOVIES_DB_PASSWORD";
    auto r = ResolvePasswordEnv(config, FakeEnv({}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().message.find("MOVIES_DB_PASSWORD") != std::string::npos);
    CHECK(r.Error().ExitCode() == 2);
}

TEST_CASE("ResolvePasswordEnv: explicit password wins", "[config][password]") {
    AppConfig config;
    config.store.password = "explicit";
    config.store.password_env = "MOVIES_DB_PASSWORD";
    auto r = ResolvePasswordEnv(config, FakeEnv({{"MOVIES_DB_PASSWORD", "from-env"}}));
    REQUIRE(r.IsOk());
    CHECK(r.Value().store.password == "explicit");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: store checks", "[config][validate]") {
    AppConfig config;

    SECTION("bolt uri") {
        config.store.uri = "bolt://localhost:7687";
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("Invalid store uri") != std::string::npos);
    }
    SECTION("bad database name") {
        config.store.database = "x";
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("empty user") {
        config.store.user.clear();
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("non-positive pool size") {
        config.store.pool_size = 0;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("non-positive acquire timeout") {
        config.store.acquire_timeout_ms = -1;
        CHECK(ValidateConfig(config).IsErr());
    }
}

TEST_CASE("ValidateConfig: offline mode skips server checks", "[config][validate]") {
    AppConfig config;
    config.store.uri = "bolt://ignored";
    config.store.offline_dataset = "movies.yaml";
    CHECK(ValidateConfig(config).IsOk());

    config.store.offline_dataset = "";
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: ranking, requests and options", "[config][validate]") {
    AppConfig config;

    SECTION("negative weight") {
        config.ranking.genre_weight = -1.0;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("non-positive request limit") {
        config.requests.push_back({"Inception", "combined", 0});
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("Inception") != std::string::npos);
    }
    SECTION("non-positive timeout") {
        config.timeout_ms = 0;
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("verbose and quiet") {
        config.verbose = true;
        config.quiet = true;
        CHECK(ValidateConfig(config).IsErr());
    }
}
