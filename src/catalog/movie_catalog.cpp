#include <cinegraph/catalog/movie_catalog.hpp>
#include <cinegraph/core/log.hpp>

#include <algorithm>

namespace cinegraph {

namespace {

void SortUnique(std::vector<std::string>& names) {
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
}

Result<MovieInfo, Error> ReadMovie(const Row& row) {
    auto node = RowNode(row, columns::kMovie);
    if (node.IsErr()) {
        return Result<MovieInfo, Error>::Err(node.Error());
    }
    return MovieFromNode(*node.Value());
}

Result<std::vector<PersonMovie>, Error> MoviesOfPerson(
    IGraphStore& store, const std::string& name, Relationship via,
    const QueryOptions& options) {
    using R = Result<std::vector<PersonMovie>, Error>;

    auto rows = store.Execute(PersonMoviesQuery{name, via}, options);
    if (rows.IsErr()) {
        return R::Err(std::move(rows).Error());
    }

    std::vector<PersonMovie> out;
    out.reserve(rows.Value().size());
    for (const auto& row : rows.Value()) {
        auto movie = ReadMovie(row);
        if (movie.IsErr()) return R::Err(std::move(movie).Error());
        auto genres = RowStrings(row, columns::kGenres);
        if (genres.IsErr()) return R::Err(std::move(genres).Error());

        PersonMovie entry{std::move(movie).Value(), std::move(genres).Value()};
        SortUnique(entry.genres);
        out.push_back(std::move(entry));
    }

    std::sort(out.begin(), out.end(), [](const PersonMovie& a, const PersonMovie& b) {
        if (a.movie.year != b.movie.year) return a.movie.year > b.movie.year;
        return a.movie.title < b.movie.title;
    });
    LogDebug("catalog", std::string(RelationshipType(via)) + " '" + name + "': " +
                        std::to_string(out.size()) + " movies");
    return R::Ok(std::move(out));
}

} // anonymous namespace

Result<std::vector<MovieInfo>, Error> ListMovies(IGraphStore& store,
                                                 const QueryOptions& options) {
    using R = Result<std::vector<MovieInfo>, Error>;

    auto rows = store.Execute(ListMoviesQuery{}, options);
    if (rows.IsErr()) {
        return R::Err(std::move(rows).Error());
    }
    std::vector<MovieInfo> movies;
    movies.reserve(rows.Value().size());
    for (const auto& row : rows.Value()) {
        auto movie = ReadMovie(row);
        if (movie.IsErr()) return R::Err(std::move(movie).Error());
        movies.push_back(std::move(movie).Value());
    }
    std::sort(movies.begin(), movies.end(),
              [](const MovieInfo& a, const MovieInfo& b) { return a.title < b.title; });
    return R::Ok(std::move(movies));
}

Result<std::optional<MovieDetails>, Error> GetMovieDetails(IGraphStore& store,
                                                           const std::string& title,
                                                           const QueryOptions& options) {
    using R = Result<std::optional<MovieDetails>, Error>;

    auto rows = store.Execute(MovieLookupQuery{title}, options);
    if (rows.IsErr()) {
        return R::Err(std::move(rows).Error());
    }
    if (rows.Value().empty()) {
        LogDebug("catalog", "movie '" + title + "' not found");
        return R::Ok(std::optional<MovieDetails>{});
    }

    const auto& row = rows.Value().front();
    auto movie = ReadMovie(row);
    if (movie.IsErr()) return R::Err(std::move(movie).Error());
    auto directors = RowStrings(row, columns::kDirectors);
    if (directors.IsErr()) return R::Err(std::move(directors).Error());
    auto cast = RowStrings(row, columns::kCast);
    if (cast.IsErr()) return R::Err(std::move(cast).Error());
    auto genres = RowStrings(row, columns::kGenres);
    if (genres.IsErr()) return R::Err(std::move(genres).Error());

    MovieDetails details;
    details.movie = std::move(movie).Value();
    details.directors = std::move(directors).Value();
    details.cast = std::move(cast).Value();
    details.genres = std::move(genres).Value();
    SortUnique(details.directors);
    SortUnique(details.cast);
    SortUnique(details.genres);
    return R::Ok(std::optional<MovieDetails>(std::move(details)));
}

Result<std::vector<PersonMovie>, Error> MoviesByActor(IGraphStore& store,
                                                      const std::string& name,
                                                      const QueryOptions& options) {
    return MoviesOfPerson(store, name, Relationship::ActedIn, options);
}

Result<std::vector<PersonMovie>, Error> MoviesByDirector(IGraphStore& store,
                                                         const std::string& name,
                                                         const QueryOptions& options) {
    return MoviesOfPerson(store, name, Relationship::Directed, options);
}

Result<GraphStatistics, Error> GetStatistics(IGraphStore& store,
                                             const QueryOptions& options) {
    using R = Result<GraphStatistics, Error>;

    auto rows = store.Execute(StatisticsQuery{}, options);
    if (rows.IsErr()) {
        return R::Err(std::move(rows).Error());
    }
    if (rows.Value().size() != 1) {
        return R::Err(Error{"GetStatistics", "", std::nullopt,
                            "Expected one statistics row, got " +
                                std::to_string(rows.Value().size()),
                            std::nullopt, ErrorCategory::Query});
    }

    const auto& row = rows.Value().front();
    GraphStatistics stats;
    for (const auto& [column, field] :
         {std::make_pair(columns::kMovies, &stats.movies),
          std::make_pair(columns::kPeople, &stats.people),
          std::make_pair(columns::kGenreCount, &stats.genres),
          std::make_pair(columns::kRelationships, &stats.relationships)}) {
        auto value = RowInt(row, column);
        if (value.IsErr()) return R::Err(std::move(value).Error());
        *field = value.Value();
    }
    return R::Ok(stats);
}

Result<void, Error> VerifyConnectivity(IGraphStore& store, const QueryOptions& options) {
    auto ping = store.Ping(options);
    if (ping.IsErr()) {
        LogWarn("catalog", "store " + store.Describe() + " unreachable: " +
                           ping.Error().ToString());
        return ping;
    }
    LogInfo("catalog", "store " + store.Describe() + " is reachable");
    return ping;
}

} // namespace cinegraph
