#include <cinegraph/graph/in_memory_store.hpp>
#include <cinegraph/core/log.hpp>

#include <algorithm>
#include <map>
#include <type_traits>

namespace cinegraph {

InMemoryGraphStore::InMemoryGraphStore(std::shared_ptr<const GraphSnapshot> snapshot,
                                       std::string source)
    : snapshot_(std::move(snapshot)), source_(std::move(source)) {}

Result<std::vector<Row>, Error> InMemoryGraphStore::Execute(
    const GraphQuery& query,
    const QueryOptions& /*options*/) {
    LogDebug("store", "execute " + DescribeQuery(query) + " in memory");
    auto rows = std::visit([this](const auto& q) -> std::vector<Row> {
        using Q = std::decay_t<decltype(q)>;
        if constexpr (std::is_same_v<Q, OverlapQuery>) {
            return Overlap(q);
        } else if constexpr (std::is_same_v<Q, MovieLookupQuery>) {
            return Lookup(q);
        } else if constexpr (std::is_same_v<Q, ListMoviesQuery>) {
            return List(q);
        } else if constexpr (std::is_same_v<Q, PersonMoviesQuery>) {
            return PersonMovies(q);
        } else {
            return Statistics(q);
        }
    }, query);
    return Result<std::vector<Row>, Error>::Ok(std::move(rows));
}

Result<void, Error> InMemoryGraphStore::Ping(const QueryOptions& /*options*/) {
    return Result<void, Error>::Ok();
}

std::string InMemoryGraphStore::Describe() const {
    return "memory:" + source_;
}

std::vector<Row> InMemoryGraphStore::Overlap(const OverlapQuery& q) const {
    if (snapshot_->FindMovie(q.anchor_title) == nullptr) {
        return {};
    }

    // Neighbours() and MoviesOf() are sorted, so shared names come out sorted.
    std::map<std::string, StringList> shared_by_movie;
    for (const auto& shared : snapshot_->Neighbours(q.anchor_title, q.via)) {
        for (const auto& title : snapshot_->MoviesOf(shared, q.via)) {
            if (title == q.anchor_title) continue;
            shared_by_movie[title].push_back(shared);
        }
    }

    std::vector<Row> rows;
    rows.reserve(shared_by_movie.size());
    for (auto& [title, names] : shared_by_movie) {
        const auto* movie = snapshot_->FindMovie(title);
        if (movie == nullptr) continue;
        Row row;
        row[columns::kMovie] = MovieToNode(*movie);
        row[columns::kSharedCount] = static_cast<int64_t>(names.size());
        row[columns::kSharedNames] = std::move(names);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<Row> InMemoryGraphStore::Lookup(const MovieLookupQuery& q) const {
    const auto* movie = snapshot_->FindMovie(q.title);
    if (movie == nullptr) {
        return {};
    }
    Row row;
    row[columns::kMovie] = MovieToNode(*movie);
    row[columns::kDirectors] = snapshot_->Neighbours(q.title, Relationship::Directed);
    row[columns::kCast] = snapshot_->Neighbours(q.title, Relationship::ActedIn);
    row[columns::kGenres] = snapshot_->Neighbours(q.title, Relationship::InGenre);
    return {std::move(row)};
}

std::vector<Row> InMemoryGraphStore::List(const ListMoviesQuery& /*q*/) const {
    std::vector<Row> rows;
    for (const auto* movie : snapshot_->Movies()) {
        Row row;
        row[columns::kMovie] = MovieToNode(*movie);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<Row> InMemoryGraphStore::PersonMovies(const PersonMoviesQuery& q) const {
    std::vector<const MovieInfo*> movies;
    for (const auto& title : snapshot_->MoviesOf(q.person_name, q.via)) {
        if (const auto* movie = snapshot_->FindMovie(title)) {
            movies.push_back(movie);
        }
    }
    std::sort(movies.begin(), movies.end(),
              [](const MovieInfo* a, const MovieInfo* b) {
                  if (a->year != b->year) return a->year > b->year;
                  return a->title < b->title;
              });

    std::vector<Row> rows;
    rows.reserve(movies.size());
    for (const auto* movie : movies) {
        Row row;
        row[columns::kMovie] = MovieToNode(*movie);
        row[columns::kGenres] = snapshot_->Neighbours(movie->title, Relationship::InGenre);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<Row> InMemoryGraphStore::Statistics(const StatisticsQuery& /*q*/) const {
    Row row;
    row[columns::kMovies] = static_cast<int64_t>(snapshot_->MovieCount());
    row[columns::kPeople] = static_cast<int64_t>(snapshot_->PersonCount());
    row[columns::kGenreCount] = static_cast<int64_t>(snapshot_->GenreCount());
    row[columns::kRelationships] = static_cast<int64_t>(snapshot_->RelationshipCount());
    return {std::move(row)};
}

} // namespace cinegraph
