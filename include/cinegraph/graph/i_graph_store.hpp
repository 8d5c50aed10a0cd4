#pragma once

#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/graph_query.hpp>

#include <string>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// IGraphStore - abstract read-only graph store.
//
// The recommendation engine and the catalog depend on this interface rather
// than on a concrete database client. This enables offline use through
// InMemoryGraphStore and unit testing through MockGraphStore.
//
// Implementations must be safe to call from several threads at once.
// Methods return Result<T, Error> and never throw on expected failures:
//   - connectivity / authentication problems -> ErrorCategory::StoreUnavailable
//   - deadline exceeded                      -> ErrorCategory::Timeout
//   - rejected query or malformed response   -> ErrorCategory::Query
// A query that matches nothing is an Ok result with zero rows.
// ---------------------------------------------------------------------------
class IGraphStore {
public:
    virtual ~IGraphStore() = default;

    // Non-copyable, non-movable (polymorphic base).
    IGraphStore(const IGraphStore&) = delete;
    IGraphStore& operator=(const IGraphStore&) = delete;
    IGraphStore(IGraphStore&&) = delete;
    IGraphStore& operator=(IGraphStore&&) = delete;

    [[nodiscard]] virtual Result<std::vector<Row>, Error> Execute(
        const GraphQuery& query,
        const QueryOptions& options = {}) = 0;

    /// Cheap round trip proving the store answers queries.
    [[nodiscard]] virtual Result<void, Error> Ping(const QueryOptions& options = {}) = 0;

    /// Human-readable identity for logs and `graph ping` output.
    [[nodiscard]] virtual std::string Describe() const = 0;

protected:
    IGraphStore() = default;
};

} // namespace cinegraph
