#pragma once

#include <cinegraph/graph/graph_snapshot.hpp>
#include <cinegraph/graph/i_graph_store.hpp>

#include <memory>
#include <string>

namespace cinegraph {

// ---------------------------------------------------------------------------
// InMemoryGraphStore - IGraphStore evaluated against a GraphSnapshot.
//
// Answers every GraphQuery with the same columns and ordering as the Neo4j
// adapter. The snapshot is shared and immutable, so concurrent calls need no
// locking. Used for --offline runs and in tests.
// ---------------------------------------------------------------------------
class InMemoryGraphStore : public IGraphStore {
public:
    explicit InMemoryGraphStore(std::shared_ptr<const GraphSnapshot> snapshot,
                                std::string source = "memory");

    [[nodiscard]] Result<std::vector<Row>, Error> Execute(
        const GraphQuery& query,
        const QueryOptions& options = {}) override;

    [[nodiscard]] Result<void, Error> Ping(const QueryOptions& options = {}) override;

    [[nodiscard]] std::string Describe() const override;

    [[nodiscard]] const GraphSnapshot& Snapshot() const { return *snapshot_; }

private:
    std::vector<Row> Overlap(const OverlapQuery& q) const;
    std::vector<Row> Lookup(const MovieLookupQuery& q) const;
    std::vector<Row> List(const ListMoviesQuery& q) const;
    std::vector<Row> PersonMovies(const PersonMoviesQuery& q) const;
    std::vector<Row> Statistics(const StatisticsQuery& q) const;

    std::shared_ptr<const GraphSnapshot> snapshot_;
    std::string source_;
};

} // namespace cinegraph
