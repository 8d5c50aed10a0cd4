#pragma once

#include <cinegraph/graph/graph_model.hpp>

#include <chrono>
#include <string>
#include <variant>

namespace cinegraph {

// ---------------------------------------------------------------------------
// Structured read-only queries understood by every IGraphStore.
//
// Each query documents the columns of the rows it yields. Adapters translate
// the structure into their own language (Cypher for Neo4j) or evaluate it
// directly (in-memory); callers never build query text.
// ---------------------------------------------------------------------------

namespace columns {
constexpr const char* kMovie         = "movie";          // Node (Movie)
constexpr const char* kSharedCount   = "shared_count";   // int, distinct shared nodes
constexpr const char* kSharedNames   = "shared_names";   // list, names of shared nodes
constexpr const char* kDirectors     = "directors";      // list
constexpr const char* kCast          = "cast";           // list
constexpr const char* kGenres        = "genres";         // list
constexpr const char* kMovies        = "movies";         // int
constexpr const char* kPeople        = "people";         // int
constexpr const char* kGenreCount    = "genre_count";    // int
constexpr const char* kRelationships = "relationships";  // int
} // namespace columns

// (anchor:Movie {title})-[via]-(shared)-[via]-(movie:Movie), movie <> anchor.
// One row per candidate movie: movie, shared_count, shared_names.
// shared_count counts distinct shared nodes, not edges. Zero rows when the
// anchor does not exist or has no `via` relationships.
struct OverlapQuery {
    std::string anchor_title;
    Relationship via = Relationship::InGenre;
};

// One row (movie, directors, cast, genres) or zero rows when absent.
struct MovieLookupQuery {
    std::string title;
};

// One row (movie) per Movie node, ordered by title.
struct ListMoviesQuery {};

// (person:Person {name})-[via]->(movie:Movie); via is ActedIn or Directed.
// One row (movie, genres) per movie, ordered by year desc then title.
struct PersonMoviesQuery {
    std::string person_name;
    Relationship via = Relationship::ActedIn;
};

// Exactly one row: movies, people, genre_count, relationships.
struct StatisticsQuery {};

using GraphQuery = std::variant<OverlapQuery,
                                MovieLookupQuery,
                                ListMoviesQuery,
                                PersonMoviesQuery,
                                StatisticsQuery>;

/// Short description for log lines, e.g. "overlap(IN_GENRE, 'Inception')".
std::string DescribeQuery(const GraphQuery& query);

// ---------------------------------------------------------------------------
// QueryOptions - per-call knobs propagated down to the adapter.
// ---------------------------------------------------------------------------
struct QueryOptions {
    // Deadline for session acquisition plus the store round trip.
    // Zero means "use the adapter's configured default".
    std::chrono::milliseconds timeout{0};
};

} // namespace cinegraph
