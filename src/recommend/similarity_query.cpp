#include <cinegraph/recommend/similarity_query.hpp>

#include <map>

namespace cinegraph {

Result<std::vector<Candidate>, Error> CollectCandidates(
    IGraphStore& store,
    const std::string& title,
    const std::vector<const ISignalExtractor*>& extractors,
    const QueryOptions& options) {
    using R = Result<std::vector<Candidate>, Error>;

    std::map<std::string, Candidate> by_title;
    for (const auto* extractor : extractors) {
        auto hits = extractor->Extract(store, title, options);
        if (hits.IsErr()) {
            return R::Err(std::move(hits).Error());
        }
        const bool genre_signal = extractor->Via() == Relationship::InGenre;
        for (auto& hit : std::move(hits).Value()) {
            auto [it, inserted] = by_title.try_emplace(hit.movie.title);
            auto& candidate = it->second;
            if (inserted) {
                candidate.movie = std::move(hit.movie);
            }
            if (genre_signal) {
                candidate.shared_genre_count = hit.count;
                candidate.shared_genres = std::move(hit.shared);
            } else {
                candidate.shared_actor_count = hit.count;
                candidate.shared_actors = std::move(hit.shared);
            }
        }
    }

    std::vector<Candidate> out;
    out.reserve(by_title.size());
    for (auto& [name, candidate] : by_title) {
        out.push_back(std::move(candidate));
    }
    return R::Ok(std::move(out));
}

Result<std::vector<Candidate>, Error> FindByGenreOverlap(
    IGraphStore& store,
    const std::string& title,
    const QueryOptions& options) {
    GenreSignal genre;
    return CollectCandidates(store, title, {&genre}, options);
}

Result<std::vector<Candidate>, Error> FindByCastOverlap(
    IGraphStore& store,
    const std::string& title,
    const QueryOptions& options) {
    CastSignal cast;
    return CollectCandidates(store, title, {&cast}, options);
}

Result<std::vector<Candidate>, Error> FindCombined(
    IGraphStore& store,
    const std::string& title,
    const QueryOptions& options) {
    GenreSignal genre;
    CastSignal cast;
    return CollectCandidates(store, title, {&genre, &cast}, options);
}

} // namespace cinegraph
