#include <cinegraph/config/config_loader.hpp>

#include <cinegraph/core/types.hpp>
#include <cinegraph/core/url.hpp>
#include <cinegraph/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace cinegraph {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidArgument};
}

const char* DefaultLookup(const char* name) {
    return std::getenv(name);
}

const char* Lookup(const EnvLookup& lookup, const char* name) {
    return lookup ? lookup(name) : DefaultLookup(name);
}

// Build a RecommendRequestConfig from a parsed YAML node.
Result<RecommendRequestConfig, Error> ParseYamlRequest(const YAML::Node& node) {
    if (!node["title"]) {
        return Result<RecommendRequestConfig, Error>::Err(
            MakeConfigError("Request entry missing 'title' field"));
    }

    auto title = MovieTitle::Create(node["title"].as<std::string>());
    if (title.IsErr()) {
        return Result<RecommendRequestConfig, Error>::Err(
            MakeConfigError("Invalid request title: " + title.Error()));
    }

    RecommendRequestConfig request;
    request.title = title.Value().Value();
    if (node["strategy"]) {
        request.strategy = node["strategy"].as<std::string>();
        auto parsed = ParseStrategy(request.strategy);
        if (parsed.IsErr()) {
            return Result<RecommendRequestConfig, Error>::Err(
                MakeConfigError(parsed.Error().message));
        }
    }
    if (node["limit"]) {
        request.limit = node["limit"].as<int>();
    }
    return Result<RecommendRequestConfig, Error>::Ok(std::move(request));
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    AppConfig config;

    // -- Store --
    if (root["store"]) {
        const auto& store = root["store"];
        if (store["uri"]) {
            config.store.uri = store["uri"].as<std::string>();
        }
        if (store["database"]) {
            config.store.database = store["database"].as<std::string>();
        }
        if (store["user"]) {
            config.store.user = store["user"].as<std::string>();
        }
        if (store["password"]) {
            config.store.password = store["password"].as<std::string>();
        }
        if (store["password_env"]) {
            config.store.password_env = store["password_env"].as<std::string>();
        }
        if (store["pool_size"]) {
            config.store.pool_size = store["pool_size"].as<int>();
        }
        if (store["acquire_timeout_ms"]) {
            config.store.acquire_timeout_ms = store["acquire_timeout_ms"].as<int>();
        }
        if (store["offline_dataset"]) {
            config.store.offline_dataset = store["offline_dataset"].as<std::string>();
        }
        if (store["disable_tls_verify"]) {
            config.store.disable_tls_verify = store["disable_tls_verify"].as<bool>();
        }
    }

    // -- Ranking --
    if (root["ranking"]) {
        const auto& ranking = root["ranking"];
        if (ranking["genre_weight"]) {
            config.ranking.genre_weight = ranking["genre_weight"].as<double>();
        }
        if (ranking["actor_weight"]) {
            config.ranking.actor_weight = ranking["actor_weight"].as<double>();
        }
        if (ranking["default_limit"]) {
            config.ranking.default_limit = ranking["default_limit"].as<int>();
        }
    }

    // -- Requests --
    if (root["requests"]) {
        for (const auto& request_node : root["requests"]) {
            auto request = ParseYamlRequest(request_node);
            if (request.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(request).Error());
            }
            config.requests.push_back(std::move(request).Value());
        }
    }

    // -- Options --
    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }
    if (root["json_output"]) {
        config.json_output = root["json_output"].as<bool>();
    }
    if (root["verbose"]) {
        config.verbose = root["verbose"].as<bool>();
    }
    if (root["quiet"]) {
        config.quiet = root["quiet"].as<bool>();
    }
    if (root["timeout_ms"]) {
        config.timeout_ms = root["timeout_ms"].as<int>();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    // Conversion errors (e.g. "pool_size: many") surface as exceptions.
    try {
        return ParseYamlRoot(root);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " +
                            std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("cinegraph", kVersion);

    // Store flags
    program.add_argument("--uri")
        .help("Neo4j HTTP URI (http://host:7474)");
    program.add_argument("--database")
        .help("Neo4j database name");
    program.add_argument("--user")
        .help("Neo4j username");
    program.add_argument("--password")
        .help("Neo4j password");
    program.add_argument("--password-env")
        .help("Environment variable containing the Neo4j password");
    program.add_argument("--pool-size")
        .help("Maximum number of concurrent store sessions")
        .scan<'i', int>();
    program.add_argument("--offline")
        .help("Serve queries from a YAML dataset instead of a server");
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);

    // Single-request mode
    program.add_argument("--title")
        .help("Reference movie title");
    program.add_argument("--strategy")
        .help("genre, cast or combined");
    program.add_argument("--limit")
        .help("Maximum number of recommendations")
        .scan<'i', int>();

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--timeout")
        .help("Per-query timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    // Store
    if (auto val = program.present("--uri")) {
        config.store.uri = *val;
    }
    if (auto val = program.present("--database")) {
        config.store.database = *val;
    }
    if (auto val = program.present("--user")) {
        config.store.user = *val;
    }
    if (auto val = program.present("--password")) {
        config.store.password = *val;
    }
    if (auto val = program.present("--password-env")) {
        config.store.password_env = *val;
    }
    if (auto val = program.present<int>("--pool-size")) {
        config.store.pool_size = *val;
    }
    if (auto val = program.present("--offline")) {
        config.store.offline_dataset = *val;
    }
    if (program.get<bool>("--insecure")) {
        config.store.disable_tls_verify = true;
    }

    // Single-request mode
    if (auto title = program.present("--title")) {
        auto title_result = MovieTitle::Create(*title);
        if (title_result.IsErr()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --title: " + title_result.Error()));
        }
        RecommendRequestConfig request;
        request.title = title_result.Value().Value();
        if (auto strategy = program.present("--strategy")) {
            auto parsed = ParseStrategy(*strategy);
            if (parsed.IsErr()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Invalid --strategy: " + parsed.Error().message));
            }
            request.strategy = *strategy;
        }
        if (auto limit = program.present<int>("--limit")) {
            request.limit = *limit;
        }
        config.requests.push_back(std::move(request));
    }

    // Options
    if (auto val = program.present<int>("--timeout")) {
        config.timeout_ms = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
AppConfig LoadFromEnv(const EnvLookup& lookup) {
    AppConfig config;
    if (const char* uri = Lookup(lookup, "NEO4J_URI")) {
        config.store.uri = uri;
    }
    if (const char* user = Lookup(lookup, "NEO4J_USERNAME")) {
        config.store.user = user;
    }
    if (const char* password = Lookup(lookup, "NEO4J_PASSWORD")) {
        config.store.password = password;
    }
    if (const char* database = Lookup(lookup, "NEO4J_DATABASE")) {
        config.store.database = database;
    }
    return config;
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides) {
    const AppConfig defaults;
    AppConfig merged = base;

    // Store overrides
    if (overrides.store.uri != defaults.store.uri) {
        merged.store.uri = overrides.store.uri;
    }
    if (overrides.store.database != defaults.store.database) {
        merged.store.database = overrides.store.database;
    }
    if (overrides.store.user != defaults.store.user) {
        merged.store.user = overrides.store.user;
    }
    if (!overrides.store.password.empty()) {
        merged.store.password = overrides.store.password;
    }
    if (overrides.store.password_env.has_value()) {
        merged.store.password_env = overrides.store.password_env;
    }
    if (overrides.store.pool_size != defaults.store.pool_size) {
        merged.store.pool_size = overrides.store.pool_size;
    }
    if (overrides.store.acquire_timeout_ms != defaults.store.acquire_timeout_ms) {
        merged.store.acquire_timeout_ms = overrides.store.acquire_timeout_ms;
    }
    if (overrides.store.offline_dataset.has_value()) {
        merged.store.offline_dataset = overrides.store.offline_dataset;
    }
    if (overrides.store.disable_tls_verify) {
        merged.store.disable_tls_verify = true;
    }

    // Ranking overrides
    if (overrides.ranking.genre_weight != defaults.ranking.genre_weight) {
        merged.ranking.genre_weight = overrides.ranking.genre_weight;
    }
    if (overrides.ranking.actor_weight != defaults.ranking.actor_weight) {
        merged.ranking.actor_weight = overrides.ranking.actor_weight;
    }
    if (overrides.ranking.default_limit != defaults.ranking.default_limit) {
        merged.ranking.default_limit = overrides.ranking.default_limit;
    }

    // Requests given on the command line replace the configured list
    if (!overrides.requests.empty()) {
        merged.requests = overrides.requests;
    }

    // Options
    if (overrides.json_output) {
        merged.json_output = true;
    }
    if (overrides.verbose) {
        merged.verbose = true;
    }
    if (overrides.quiet) {
        merged.quiet = true;
    }
    if (overrides.timeout_ms != defaults.timeout_ms) {
        merged.timeout_ms = overrides.timeout_ms;
    }
    if (overrides.log_file.has_value()) {
        merged.log_file = overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolvePasswordEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config, const EnvLookup& lookup) {
    if (config.store.password.empty() && config.store.password_env.has_value()) {
        const auto& env_var = *config.store.password_env;
        const char* env_val = Lookup(lookup, env_var.c_str());
        if (env_val == nullptr) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by password_env)"));
        }
        config.store.password = env_val;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (!config.store.offline_dataset.has_value()) {
        auto endpoint = ParseHttpUri(config.store.uri);
        if (endpoint.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid store uri: " + endpoint.Error().message));
        }
        auto database = DatabaseName::Create(config.store.database);
        if (database.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid database name: " + database.Error()));
        }
        if (config.store.user.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Missing required field: user"));
        }
    } else if (config.store.offline_dataset->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("offline_dataset must name a dataset file"));
    }
    if (config.store.pool_size <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("pool_size must be positive, got " +
                            std::to_string(config.store.pool_size)));
    }
    if (config.store.acquire_timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("acquire_timeout_ms must be positive, got " +
                            std::to_string(config.store.acquire_timeout_ms)));
    }

    auto policy = ValidatePolicy(config.ranking);
    if (policy.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid ranking policy: " + policy.Error().message));
    }

    for (const auto& request : config.requests) {
        if (request.limit.has_value() && *request.limit <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("Request '" + request.title +
                                "': limit must be positive, got " +
                                std::to_string(*request.limit)));
        }
    }

    if (config.timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.timeout_ms)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace cinegraph
