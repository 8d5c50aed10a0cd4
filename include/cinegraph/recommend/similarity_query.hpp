#pragma once

#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/i_graph_store.hpp>
#include <cinegraph/recommend/signal_extractor.hpp>

#include <string>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// Candidate - a movie related to the anchor, with both signal counts.
// Counts are >= 0 and at least one of them is > 0.
// ---------------------------------------------------------------------------
struct Candidate {
    MovieInfo movie;
    int shared_genre_count = 0;
    int shared_actor_count = 0;
    std::vector<std::string> shared_genres;
    std::vector<std::string> shared_actors;
};

// Genre overlap only; shared_actor_count is 0 for every candidate.
[[nodiscard]] Result<std::vector<Candidate>, Error> FindByGenreOverlap(
    IGraphStore& store,
    const std::string& title,
    const QueryOptions& options = {});

// Cast overlap only; shared_genre_count is 0 for every candidate.
[[nodiscard]] Result<std::vector<Candidate>, Error> FindByCastOverlap(
    IGraphStore& store,
    const std::string& title,
    const QueryOptions& options = {});

// Union of both signals; a candidate missing from one signal gets 0 for it.
// Any failing signal fails the whole call.
[[nodiscard]] Result<std::vector<Candidate>, Error> FindCombined(
    IGraphStore& store,
    const std::string& title,
    const QueryOptions& options = {});

// Run the given extractors and union their hits by title. IN_GENRE signals
// fill the genre fields, every other signal fills the actor fields.
// Output is ordered by title.
[[nodiscard]] Result<std::vector<Candidate>, Error> CollectCandidates(
    IGraphStore& store,
    const std::string& title,
    const std::vector<const ISignalExtractor*>& extractors,
    const QueryOptions& options = {});

} // namespace cinegraph
