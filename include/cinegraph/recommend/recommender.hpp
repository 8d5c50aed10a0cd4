#pragma once

#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/i_graph_store.hpp>
#include <cinegraph/recommend/ranking.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// RecommendRequest - full form of a recommendation call.
// ---------------------------------------------------------------------------
struct RecommendRequest {
    std::string title;
    Strategy strategy = Strategy::Combined;
    std::optional<int> limit;                        // nullopt: policy default
    std::optional<std::chrono::milliseconds> timeout; // nullopt: store default
};

// ---------------------------------------------------------------------------
// Recommender - the recommendation entry point.
//
// Validates the request, collects candidates through the similarity query
// layer and ranks them with the RankingPolicy. Holds no mutable state, so one
// instance may serve concurrent callers. The store must outlive this object.
//
//   - limit <= 0, empty title or unknown strategy -> InvalidArgument
//   - unknown title                               -> Ok, empty list
//   - store failures (StoreUnavailable, Timeout, Query) propagate unchanged
// ---------------------------------------------------------------------------
class Recommender {
public:
    explicit Recommender(IGraphStore& store, RankingPolicy policy = {});

    Recommender(const Recommender&) = delete;
    Recommender& operator=(const Recommender&) = delete;

    [[nodiscard]] Result<std::vector<ScoredCandidate>, Error> Recommend(
        const std::string& title, Strategy strategy, int limit) const;

    [[nodiscard]] Result<std::vector<ScoredCandidate>, Error> Recommend(
        const std::string& title, std::string_view strategy, int limit) const;

    [[nodiscard]] Result<std::vector<ScoredCandidate>, Error> Recommend(
        const RecommendRequest& request) const;

    [[nodiscard]] const RankingPolicy& Policy() const { return policy_; }

private:
    IGraphStore& store_;
    RankingPolicy policy_;
};

} // namespace cinegraph
