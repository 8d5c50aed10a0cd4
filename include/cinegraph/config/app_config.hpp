#pragma once

#include <cinegraph/recommend/ranking.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cinegraph {

struct StoreConfig {
    std::string uri = "http://localhost:7474";
    std::string database = "neo4j";
    std::string user = "neo4j";
    std::string password;
    std::optional<std::string> password_env; // env var name to read password from
    int pool_size = 8;
    int acquire_timeout_ms = 120000;
    std::optional<std::string> offline_dataset; // YAML dataset; no server used
    bool disable_tls_verify = false;
};

struct RecommendRequestConfig {
    std::string title;
    std::string strategy = "combined";
    std::optional<int> limit; // defaults to ranking.default_limit
};

struct AppConfig {
    StoreConfig store;
    RankingPolicy ranking;
    std::vector<RecommendRequestConfig> requests;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    int timeout_ms = 30000;
};

} // namespace cinegraph
