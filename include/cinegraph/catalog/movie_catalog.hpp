#pragma once

#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/graph_model.hpp>
#include <cinegraph/graph/i_graph_store.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// Catalog read models.
// ---------------------------------------------------------------------------
struct MovieDetails {
    MovieInfo movie;
    std::vector<std::string> directors;  // sorted, distinct
    std::vector<std::string> cast;       // sorted, distinct
    std::vector<std::string> genres;     // sorted, distinct
};

struct PersonMovie {
    MovieInfo movie;
    std::vector<std::string> genres;     // sorted, distinct
};

struct GraphStatistics {
    int64_t movies = 0;
    int64_t people = 0;
    int64_t genres = 0;
    int64_t relationships = 0;
};

// ---------------------------------------------------------------------------
// Catalog operations - read-only lookups through IGraphStore.
// Unknown entities give empty / nullopt results; store errors propagate.
// ---------------------------------------------------------------------------

/// All movies ordered by title.
[[nodiscard]] Result<std::vector<MovieInfo>, Error> ListMovies(
    IGraphStore& store, const QueryOptions& options = {});

/// A movie with its directors, cast and genres; nullopt when absent.
[[nodiscard]] Result<std::optional<MovieDetails>, Error> GetMovieDetails(
    IGraphStore& store, const std::string& title, const QueryOptions& options = {});

/// Movies a person acted in, newest first, then by title.
[[nodiscard]] Result<std::vector<PersonMovie>, Error> MoviesByActor(
    IGraphStore& store, const std::string& name, const QueryOptions& options = {});

/// Movies a person directed, newest first, then by title.
[[nodiscard]] Result<std::vector<PersonMovie>, Error> MoviesByDirector(
    IGraphStore& store, const std::string& name, const QueryOptions& options = {});

[[nodiscard]] Result<GraphStatistics, Error> GetStatistics(
    IGraphStore& store, const QueryOptions& options = {});

/// The store's ping, logged under "catalog".
[[nodiscard]] Result<void, Error> VerifyConnectivity(
    IGraphStore& store, const QueryOptions& options = {});

} // namespace cinegraph
