#pragma once

#include <cinegraph/core/types.hpp>
#include <cinegraph/core/url.hpp>
#include <cinegraph/graph/i_graph_store.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace cinegraph {

// ---------------------------------------------------------------------------
// Neo4jStoreOptions - connection and pooling knobs for Neo4jGraphStore.
// ---------------------------------------------------------------------------
struct Neo4jStoreOptions {
    std::chrono::seconds connect_timeout{10};
    // Used when QueryOptions::timeout is zero.
    std::chrono::milliseconds default_timeout{30000};
    // Upper bound on waiting for an idle session.
    std::chrono::milliseconds acquire_timeout{120000};
    size_t pool_size = 8;
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// Neo4jGraphStore - IGraphStore over the Neo4j HTTP transactional endpoint.
//
// Uses pimpl to keep httplib out of the public header. Each query leases an
// httplib::Client from a SessionPool, POSTs one parameterized Cypher
// statement to /db/<database>/tx/commit with Basic Auth, and decodes the
// rows. The per-call deadline covers both the lease wait and the request.
// ---------------------------------------------------------------------------
class Neo4jGraphStore : public IGraphStore {
public:
    Neo4jGraphStore(const HttpEndpoint& endpoint,
                    const DatabaseName& database,
                    const std::string& user,
                    const std::string& password,
                    const Neo4jStoreOptions& options = {});

    ~Neo4jGraphStore() override;

    Neo4jGraphStore(const Neo4jGraphStore&) = delete;
    Neo4jGraphStore& operator=(const Neo4jGraphStore&) = delete;
    Neo4jGraphStore(Neo4jGraphStore&&) = delete;
    Neo4jGraphStore& operator=(Neo4jGraphStore&&) = delete;

    // -- IGraphStore implementation ------------------------------------------

    [[nodiscard]] Result<std::vector<Row>, Error> Execute(
        const GraphQuery& query,
        const QueryOptions& options = {}) override;

    [[nodiscard]] Result<void, Error> Ping(const QueryOptions& options = {}) override;

    [[nodiscard]] std::string Describe() const override;

    /// Path of the commit endpoint, e.g. "/db/neo4j/tx/commit".
    [[nodiscard]] const std::string& CommitPath() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cinegraph
