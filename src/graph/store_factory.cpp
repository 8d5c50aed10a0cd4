#include <cinegraph/graph/store_factory.hpp>

#include <cinegraph/core/log.hpp>
#include <cinegraph/core/types.hpp>
#include <cinegraph/core/url.hpp>
#include <cinegraph/graph/graph_loader.hpp>
#include <cinegraph/graph/in_memory_store.hpp>
#include <cinegraph/graph/neo4j_store.hpp>

namespace cinegraph {

Result<std::unique_ptr<IGraphStore>, Error> CreateGraphStore(const AppConfig& config) {
    using R = Result<std::unique_ptr<IGraphStore>, Error>;

    if (config.store.offline_dataset.has_value()) {
        const auto& path = *config.store.offline_dataset;
        auto snapshot = LoadGraphDataset(path);
        if (snapshot.IsErr()) {
            return R::Err(std::move(snapshot).Error());
        }
        LogInfo("store", "offline dataset " + path);
        auto shared = std::make_shared<const GraphSnapshot>(std::move(snapshot).Value());
        std::unique_ptr<IGraphStore> store =
            std::make_unique<InMemoryGraphStore>(std::move(shared), path);
        return R::Ok(std::move(store));
    }

    auto endpoint = ParseHttpUri(config.store.uri);
    if (endpoint.IsErr()) {
        return R::Err(std::move(endpoint).Error());
    }
    auto database = DatabaseName::Create(config.store.database);
    if (database.IsErr()) {
        return R::Err(Error::InvalidArgument("CreateGraphStore",
                                             "Invalid database name: " + database.Error()));
    }

    Neo4jStoreOptions options;
    options.pool_size = static_cast<size_t>(config.store.pool_size > 0 ? config.store.pool_size : 1);
    options.acquire_timeout = std::chrono::milliseconds(config.store.acquire_timeout_ms);
    options.default_timeout = std::chrono::milliseconds(config.timeout_ms);
    options.disable_tls_verify = config.store.disable_tls_verify;

    LogInfo("store", "neo4j " + endpoint.Value().BaseUrl() + " database " +
                     database.Value().Value() + " as " + config.store.user);
    std::unique_ptr<IGraphStore> store = std::make_unique<Neo4jGraphStore>(
        endpoint.Value(), database.Value(), config.store.user,
        config.store.password, options);
    return R::Ok(std::move(store));
}

} // namespace cinegraph
