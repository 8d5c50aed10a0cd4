#include <cinegraph/recommend/recommender.hpp>
#include <cinegraph/core/log.hpp>
#include <cinegraph/recommend/similarity_query.hpp>

namespace cinegraph {

Recommender::Recommender(IGraphStore& store, RankingPolicy policy)
    : store_(store), policy_(policy) {}

Result<std::vector<ScoredCandidate>, Error> Recommender::Recommend(
    const std::string& title, Strategy strategy, int limit) const {
    RecommendRequest request;
    request.title = title;
    request.strategy = strategy;
    request.limit = limit;
    return Recommend(request);
}

Result<std::vector<ScoredCandidate>, Error> Recommender::Recommend(
    const std::string& title, std::string_view strategy, int limit) const {
    auto parsed = ParseStrategy(strategy);
    if (parsed.IsErr()) {
        return Result<std::vector<ScoredCandidate>, Error>::Err(parsed.Error());
    }
    return Recommend(title, parsed.Value(), limit);
}

Result<std::vector<ScoredCandidate>, Error> Recommender::Recommend(
    const RecommendRequest& request) const {
    using R = Result<std::vector<ScoredCandidate>, Error>;

    const int limit = request.limit.value_or(policy_.default_limit);
    if (limit <= 0) {
        return R::Err(Error::InvalidArgument(
            "Recommend", "limit must be positive, got " + std::to_string(limit)));
    }
    if (request.title.empty()) {
        return R::Err(Error::InvalidArgument("Recommend", "title must not be empty"));
    }

    QueryOptions options;
    if (request.timeout.has_value()) {
        options.timeout = *request.timeout;
    }

    LogInfo("recommend", std::string(StrategyName(request.strategy)) +
                         " recommendations for '" + request.title +
                         "' (limit " + std::to_string(limit) + ")");

    Result<std::vector<Candidate>, Error> candidates = [&]() {
        switch (request.strategy) {
            case Strategy::Genre:
                return FindByGenreOverlap(store_, request.title, options);
            case Strategy::Cast:
                return FindByCastOverlap(store_, request.title, options);
            case Strategy::Combined:
                break;
        }
        return FindCombined(store_, request.title, options);
    }();
    if (candidates.IsErr()) {
        return R::Err(std::move(candidates).Error());
    }

    auto ranked = Rank(std::move(candidates).Value(), request.strategy, policy_,
                       static_cast<size_t>(limit));
    LogDebug("recommend", std::to_string(ranked.size()) + " recommendations");
    return R::Ok(std::move(ranked));
}

} // namespace cinegraph
