#pragma once

#include <cinegraph/config/app_config.hpp>
#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/i_graph_store.hpp>

#include <functional>
#include <memory>

namespace cinegraph {

// Build the store a config asks for: an InMemoryGraphStore over the offline
// dataset when one is configured, otherwise a Neo4jGraphStore for store.uri.
// Password resolution (password_env) must already have happened.
[[nodiscard]] Result<std::unique_ptr<IGraphStore>, Error> CreateGraphStore(
    const AppConfig& config);

// Signature of CreateGraphStore, injectable so the CLI can run on mocks.
using StoreFactory =
    std::function<Result<std::unique_ptr<IGraphStore>, Error>(const AppConfig&)>;

} // namespace cinegraph
