#include <cinegraph/recommend/signal_extractor.hpp>
#include <cinegraph/core/log.hpp>

#include <algorithm>
#include <set>

namespace cinegraph {

Result<std::vector<SignalHit>, Error> ISignalExtractor::Extract(
    IGraphStore& store,
    const std::string& anchor_title,
    const QueryOptions& options) const {
    using R = Result<std::vector<SignalHit>, Error>;

    auto rows = store.Execute(OverlapQuery{anchor_title, Via()}, options);
    if (rows.IsErr()) {
        LogWarn("recommend", std::string(Name()) + " signal failed: " +
                             rows.Error().ToString());
        return R::Err(std::move(rows).Error());
    }

    std::vector<SignalHit> hits;
    std::set<std::string> seen;
    hits.reserve(rows.Value().size());

    for (const auto& row : rows.Value()) {
        auto node = RowNode(row, columns::kMovie);
        if (node.IsErr()) return R::Err(node.Error());
        auto movie = MovieFromNode(*node.Value());
        if (movie.IsErr()) return R::Err(movie.Error());

        auto count = RowInt(row, columns::kSharedCount);
        if (count.IsErr()) return R::Err(count.Error());
        auto shared = RowStrings(row, columns::kSharedNames);
        if (shared.IsErr()) return R::Err(shared.Error());

        const auto& title = movie.Value().title;
        if (title == anchor_title || count.Value() <= 0) {
            continue;
        }
        if (!seen.insert(title).second) {
            return R::Err(Error{"ExtractSignal", Name(), std::nullopt,
                                "Store returned '" + title + "' more than once",
                                std::nullopt, ErrorCategory::Query});
        }

        SignalHit hit;
        hit.movie = std::move(movie).Value();
        hit.count = static_cast<int>(count.Value());
        hit.shared = std::move(shared).Value();
        std::sort(hit.shared.begin(), hit.shared.end());
        hits.push_back(std::move(hit));
    }

    LogDebug("recommend", std::string(Name()) + " signal: " +
                          std::to_string(hits.size()) + " candidates for '" +
                          anchor_title + "'");
    return R::Ok(std::move(hits));
}

} // namespace cinegraph
