#pragma once

#include <cinegraph/core/result.hpp>
#include <cinegraph/recommend/similarity_query.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// Strategy - which similarity signal(s) drive a recommendation.
// ---------------------------------------------------------------------------
enum class Strategy {
    Genre,
    Cast,
    Combined,
};

/// "genre", "cast" or "combined" (case-insensitive); anything else is
/// InvalidArgument.
[[nodiscard]] Result<Strategy, Error> ParseStrategy(std::string_view name);

const char* StrategyName(Strategy strategy);

// ---------------------------------------------------------------------------
// RankingPolicy - weights of the combined score and the default limit.
//
//   composite = shared_genre_count * genre_weight
//             + shared_actor_count * actor_weight
// ---------------------------------------------------------------------------
struct RankingPolicy {
    double genre_weight = 2.0;
    double actor_weight = 3.0;
    int default_limit = 5;

    bool operator==(const RankingPolicy& other) const {
        return genre_weight == other.genre_weight &&
               actor_weight == other.actor_weight &&
               default_limit == other.default_limit;
    }
};

/// Weights must be finite and >= 0; default_limit must be > 0.
[[nodiscard]] Result<void, Error> ValidatePolicy(const RankingPolicy& policy);

// ---------------------------------------------------------------------------
// ScoredCandidate - a ranked recommendation.
// ---------------------------------------------------------------------------
struct ScoredCandidate {
    MovieInfo movie;
    int shared_genre_count = 0;
    int shared_actor_count = 0;
    // Equals the strategy score for the single-signal strategies.
    double composite_score = 0.0;
    std::vector<std::string> shared_genres;
    std::vector<std::string> shared_actors;
};

/// Score every candidate, order deterministically and keep the first `limit`.
///   genre / cast : score desc, title asc
///   combined     : composite desc, shared_actor_count desc, title asc
/// The result never depends on the order of `candidates`.
std::vector<ScoredCandidate> Rank(std::vector<Candidate> candidates,
                                  Strategy strategy,
                                  const RankingPolicy& policy,
                                  size_t limit);

} // namespace cinegraph
