#pragma once

#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/graph_model.hpp>

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// GraphSnapshot - an in-process copy of the movie graph.
//
// Built once (by the dataset loader or a test), then only read. Nodes are
// keyed by identity (movie title, person name, genre name). Relate() checks
// that both endpoints exist; repeating an edge is a no-op, so counts are
// always counts of distinct neighbours.
// ---------------------------------------------------------------------------
class GraphSnapshot {
public:
    /// Fails with InvalidArgument on an empty or duplicate title.
    [[nodiscard]] Result<void, Error> AddMovie(MovieInfo movie);
    /// Adding an existing person or genre is a no-op.
    [[nodiscard]] Result<void, Error> AddPerson(const std::string& name);
    [[nodiscard]] Result<void, Error> AddGenre(const std::string& name);

    /// ACTED_IN / DIRECTED: from = person, to = movie.
    /// IN_GENRE: from = movie, to = genre.
    [[nodiscard]] Result<void, Error> Relate(const std::string& from,
                                             Relationship rel,
                                             const std::string& to);

    [[nodiscard]] const MovieInfo* FindMovie(const std::string& title) const;
    [[nodiscard]] bool HasPerson(const std::string& name) const;
    [[nodiscard]] bool HasGenre(const std::string& name) const;

    /// All movies ordered by title.
    [[nodiscard]] std::vector<const MovieInfo*> Movies() const;

    /// Names on the far side of `rel` from a movie, sorted.
    [[nodiscard]] std::vector<std::string> Neighbours(const std::string& title,
                                                      Relationship rel) const;

    /// Titles linked to a person or genre through `rel`, sorted.
    [[nodiscard]] std::vector<std::string> MoviesOf(const std::string& counterpart,
                                                    Relationship rel) const;

    [[nodiscard]] size_t MovieCount() const { return movies_.size(); }
    [[nodiscard]] size_t PersonCount() const { return people_.size(); }
    [[nodiscard]] size_t GenreCount() const { return genres_.size(); }
    [[nodiscard]] size_t RelationshipCount() const;

private:
    struct Adjacency {
        std::map<std::string, std::set<std::string>> by_movie;
        std::map<std::string, std::set<std::string>> by_counterpart;
    };

    std::map<std::string, MovieInfo> movies_;
    std::set<std::string> people_;
    std::set<std::string> genres_;
    std::map<Relationship, Adjacency> edges_;
};

} // namespace cinegraph
