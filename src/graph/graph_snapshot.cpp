#include <cinegraph/graph/graph_snapshot.hpp>

namespace cinegraph {

namespace {

Error MakeSnapshotError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidArgument};
}

} // anonymous namespace

Result<void, Error> GraphSnapshot::AddMovie(MovieInfo movie) {
    if (movie.title.empty()) {
        return Result<void, Error>::Err(
            MakeSnapshotError("AddMovie", "Movie title must not be empty"));
    }
    if (movies_.count(movie.title) > 0) {
        return Result<void, Error>::Err(
            MakeSnapshotError("AddMovie", "Duplicate movie title '" + movie.title + "'"));
    }
    auto title = movie.title;
    movies_.emplace(std::move(title), std::move(movie));
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphSnapshot::AddPerson(const std::string& name) {
    if (name.empty()) {
        return Result<void, Error>::Err(
            MakeSnapshotError("AddPerson", "Person name must not be empty"));
    }
    people_.insert(name);
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphSnapshot::AddGenre(const std::string& name) {
    if (name.empty()) {
        return Result<void, Error>::Err(
            MakeSnapshotError("AddGenre", "Genre name must not be empty"));
    }
    genres_.insert(name);
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphSnapshot::Relate(const std::string& from,
                                          Relationship rel,
                                          const std::string& to) {
    const bool into_movie = PointsIntoMovie(rel);
    const std::string& movie = into_movie ? to : from;
    const std::string& counterpart = into_movie ? from : to;
    const std::string edge = "(" + from + ")-[:" + RelationshipType(rel) + "]->(" + to + ")";

    if (movies_.count(movie) == 0) {
        return Result<void, Error>::Err(
            MakeSnapshotError("Relate", edge + ": unknown movie '" + movie + "'"));
    }
    const bool counterpart_known = into_movie ? HasPerson(counterpart)
                                              : HasGenre(counterpart);
    if (!counterpart_known) {
        return Result<void, Error>::Err(MakeSnapshotError(
            "Relate", edge + ": unknown " + std::string(CounterpartLabel(rel)) +
                          " '" + counterpart + "'"));
    }

    auto& adjacency = edges_[rel];
    adjacency.by_movie[movie].insert(counterpart);
    adjacency.by_counterpart[counterpart].insert(movie);
    return Result<void, Error>::Ok();
}

const MovieInfo* GraphSnapshot::FindMovie(const std::string& title) const {
    auto it = movies_.find(title);
    return it == movies_.end() ? nullptr : &it->second;
}

bool GraphSnapshot::HasPerson(const std::string& name) const {
    return people_.count(name) > 0;
}

bool GraphSnapshot::HasGenre(const std::string& name) const {
    return genres_.count(name) > 0;
}

std::vector<const MovieInfo*> GraphSnapshot::Movies() const {
    std::vector<const MovieInfo*> out;
    out.reserve(movies_.size());
    for (const auto& [title, movie] : movies_) {
        out.push_back(&movie);
    }
    return out;
}

std::vector<std::string> GraphSnapshot::Neighbours(const std::string& title,
                                                   Relationship rel) const {
    auto adj = edges_.find(rel);
    if (adj == edges_.end()) return {};
    auto it = adj->second.by_movie.find(title);
    if (it == adj->second.by_movie.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<std::string> GraphSnapshot::MoviesOf(const std::string& counterpart,
                                                 Relationship rel) const {
    auto adj = edges_.find(rel);
    if (adj == edges_.end()) return {};
    auto it = adj->second.by_counterpart.find(counterpart);
    if (it == adj->second.by_counterpart.end()) return {};
    return {it->second.begin(), it->second.end()};
}

size_t GraphSnapshot::RelationshipCount() const {
    size_t total = 0;
    for (const auto& [rel, adjacency] : edges_) {
        for (const auto& [movie, neighbours] : adjacency.by_movie) {
            total += neighbours.size();
        }
    }
    return total;
}

} // namespace cinegraph
