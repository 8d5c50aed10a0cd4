#include <cinegraph/recommend/ranking.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>

namespace cinegraph {

namespace {

double ScoreFor(const Candidate& c, Strategy strategy, const RankingPolicy& policy) {
    switch (strategy) {
        case Strategy::Genre:
            return static_cast<double>(c.shared_genre_count);
        case Strategy::Cast:
            return static_cast<double>(c.shared_actor_count);
        case Strategy::Combined:
            return c.shared_genre_count * policy.genre_weight +
                   c.shared_actor_count * policy.actor_weight;
    }
    return 0.0;
}

// Strict weak ordering; titles are unique so the order is total.
bool RanksBefore(const ScoredCandidate& a, const ScoredCandidate& b, Strategy strategy) {
    if (a.composite_score != b.composite_score) {
        return a.composite_score > b.composite_score;
    }
    if (strategy == Strategy::Combined &&
        a.shared_actor_count != b.shared_actor_count) {
        return a.shared_actor_count > b.shared_actor_count;
    }
    return a.movie.title < b.movie.title;
}

} // anonymous namespace

Result<Strategy, Error> ParseStrategy(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "genre") return Result<Strategy, Error>::Ok(Strategy::Genre);
    if (lower == "cast") return Result<Strategy, Error>::Ok(Strategy::Cast);
    if (lower == "combined") return Result<Strategy, Error>::Ok(Strategy::Combined);
    return Result<Strategy, Error>::Err(Error::InvalidArgument(
        "ParseStrategy",
        "Unknown strategy '" + std::string(name) + "' (expected genre, cast or combined)"));
}

const char* StrategyName(Strategy strategy) {
    switch (strategy) {
        case Strategy::Genre:    return "genre";
        case Strategy::Cast:     return "cast";
        case Strategy::Combined: return "combined";
    }
    return "combined";
}

Result<void, Error> ValidatePolicy(const RankingPolicy& policy) {
    if (!std::isfinite(policy.genre_weight) || policy.genre_weight < 0.0) {
        return Result<void, Error>::Err(Error::InvalidArgument(
            "ValidatePolicy", "genre_weight must be a finite number >= 0"));
    }
    if (!std::isfinite(policy.actor_weight) || policy.actor_weight < 0.0) {
        return Result<void, Error>::Err(Error::InvalidArgument(
            "ValidatePolicy", "actor_weight must be a finite number >= 0"));
    }
    if (policy.default_limit <= 0) {
        return Result<void, Error>::Err(Error::InvalidArgument(
            "ValidatePolicy", "default_limit must be positive, got " +
                              std::to_string(policy.default_limit)));
    }
    return Result<void, Error>::Ok();
}

std::vector<ScoredCandidate> Rank(std::vector<Candidate> candidates,
                                  Strategy strategy,
                                  const RankingPolicy& policy,
                                  size_t limit) {
    std::vector<ScoredCandidate> scored;
    scored.reserve(candidates.size());
    for (auto& c : candidates) {
        ScoredCandidate s;
        s.composite_score = ScoreFor(c, strategy, policy);
        s.movie = std::move(c.movie);
        s.shared_genre_count = c.shared_genre_count;
        s.shared_actor_count = c.shared_actor_count;
        s.shared_genres = std::move(c.shared_genres);
        s.shared_actors = std::move(c.shared_actors);
        scored.push_back(std::move(s));
    }

    const size_t keep = std::min(limit, scored.size());
    auto cmp = [strategy](const ScoredCandidate& a, const ScoredCandidate& b) {
        return RanksBefore(a, b, strategy);
    };
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep),
                      scored.end(), cmp);
    scored.resize(keep);
    return scored;
}

} // namespace cinegraph
