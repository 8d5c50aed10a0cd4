#pragma once

#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/graph_model.hpp>
#include <cinegraph/graph/i_graph_store.hpp>

#include <string>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// SignalHit - one candidate movie seen through one similarity signal.
// ---------------------------------------------------------------------------
struct SignalHit {
    MovieInfo movie;
    int count = 0;                     // distinct shared neighbours, always > 0
    std::vector<std::string> shared;   // their names, sorted
};

// ---------------------------------------------------------------------------
// ISignalExtractor - one structural similarity signal between movies.
//
// A signal is "movies reachable from the anchor through a shared neighbour
// over one relationship type". Extract() issues a single OverlapQuery and
// normalizes its rows:
//   - the anchor itself is dropped even if the store returned it
//   - rows with a non-positive count are dropped
//   - a title seen twice is a Query error (the store broke the grouping)
// An unknown anchor gives an empty list, never an error.
// ---------------------------------------------------------------------------
class ISignalExtractor {
public:
    virtual ~ISignalExtractor() = default;

    /// Short name used in logs ("genre", "cast").
    [[nodiscard]] virtual const char* Name() const = 0;

    /// Relationship the overlap is computed over.
    [[nodiscard]] virtual Relationship Via() const = 0;

    [[nodiscard]] Result<std::vector<SignalHit>, Error> Extract(
        IGraphStore& store,
        const std::string& anchor_title,
        const QueryOptions& options = {}) const;

protected:
    ISignalExtractor() = default;
};

// Shared genres (IN_GENRE).
class GenreSignal final : public ISignalExtractor {
public:
    [[nodiscard]] const char* Name() const override { return "genre"; }
    [[nodiscard]] Relationship Via() const override { return Relationship::InGenre; }
};

// Shared cast members (ACTED_IN).
class CastSignal final : public ISignalExtractor {
public:
    [[nodiscard]] const char* Name() const override { return "cast"; }
    [[nodiscard]] Relationship Via() const override { return Relationship::ActedIn; }
};

} // namespace cinegraph
