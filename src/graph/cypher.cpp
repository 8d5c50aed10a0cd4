#include <cinegraph/graph/cypher.hpp>

#include <type_traits>

namespace cinegraph {

namespace {

const char* kMovieProjection =
    "movie {.title, .year, .rating, .tagline, .description}";

// Edge segment walking from a Movie towards its counterpart:
// "<-[:ACTED_IN]-" for person edges, "-[:IN_GENRE]->" for genre edges.
std::string EdgeFromMovie(Relationship via) {
    std::string type = RelationshipType(via);
    return PointsIntoMovie(via) ? "<-[:" + type + "]-" : "-[:" + type + "]->";
}

// The same edge walked from the counterpart towards the Movie.
std::string EdgeToMovie(Relationship via) {
    std::string type = RelationshipType(via);
    return PointsIntoMovie(via) ? "-[:" + type + "]->" : "<-[:" + type + "]-";
}

CypherStatement BuildOverlap(const OverlapQuery& q) {
    std::string shared = std::string("shared:") + CounterpartLabel(q.via);

    CypherStatement stmt;
    stmt.text =
        "MATCH (anchor:Movie {title: $title})" + EdgeFromMovie(q.via) +
        "(" + shared + ")" + EdgeToMovie(q.via) + "(movie:Movie)" +
        " WHERE movie <> anchor"
        " WITH movie, COUNT(DISTINCT shared) AS shared_count,"
        " COLLECT(DISTINCT shared.name) AS shared_names"
        " RETURN " + std::string(kMovieProjection) +
        " AS movie, shared_count, shared_names";
    stmt.parameters["title"] = q.anchor_title;
    stmt.node_columns[columns::kMovie] = "Movie";
    return stmt;
}

CypherStatement BuildLookup(const MovieLookupQuery& q) {
    CypherStatement stmt;
    stmt.text =
        "MATCH (movie:Movie {title: $title})"
        " OPTIONAL MATCH (director:Person)-[:DIRECTED]->(movie)"
        " WITH movie, COLLECT(DISTINCT director.name) AS directors"
        " OPTIONAL MATCH (actor:Person)-[:ACTED_IN]->(movie)"
        " WITH movie, directors, COLLECT(DISTINCT actor.name) AS cast"
        " OPTIONAL MATCH (movie)-[:IN_GENRE]->(genre:Genre)"
        " WITH movie, directors, cast, COLLECT(DISTINCT genre.name) AS genres"
        " RETURN " + std::string(kMovieProjection) +
        " AS movie, directors, cast, genres"
        " LIMIT 1";
    stmt.parameters["title"] = q.title;
    stmt.node_columns[columns::kMovie] = "Movie";
    return stmt;
}

CypherStatement BuildList(const ListMoviesQuery&) {
    CypherStatement stmt;
    stmt.text =
        "MATCH (movie:Movie)"
        " RETURN " + std::string(kMovieProjection) + " AS movie"
        " ORDER BY movie.title";
    stmt.node_columns[columns::kMovie] = "Movie";
    return stmt;
}

CypherStatement BuildPersonMovies(const PersonMoviesQuery& q) {
    CypherStatement stmt;
    stmt.text =
        "MATCH (person:Person {name: $name})" + EdgeToMovie(q.via) + "(movie:Movie)" +
        " OPTIONAL MATCH (movie)-[:IN_GENRE]->(genre:Genre)"
        " WITH movie, COLLECT(DISTINCT genre.name) AS genres"
        " RETURN " + std::string(kMovieProjection) + " AS movie, genres"
        " ORDER BY movie.year DESC, movie.title";
    stmt.parameters["name"] = q.person_name;
    stmt.node_columns[columns::kMovie] = "Movie";
    return stmt;
}

CypherStatement BuildStatistics(const StatisticsQuery&) {
    CypherStatement stmt;
    stmt.text =
        "CALL { MATCH (m:Movie) RETURN COUNT(m) AS movies }"
        " CALL { MATCH (p:Person) RETURN COUNT(p) AS people }"
        " CALL { MATCH (g:Genre) RETURN COUNT(g) AS genre_count }"
        " CALL { MATCH ()-[r:ACTED_IN|DIRECTED|IN_GENRE]->() RETURN COUNT(r) AS relationships }"
        " RETURN movies, people, genre_count, relationships";
    return stmt;
}

} // anonymous namespace

CypherStatement BuildCypher(const GraphQuery& query) {
    return std::visit([](const auto& q) -> CypherStatement {
        using Q = std::decay_t<decltype(q)>;
        if constexpr (std::is_same_v<Q, OverlapQuery>) {
            return BuildOverlap(q);
        } else if constexpr (std::is_same_v<Q, MovieLookupQuery>) {
            return BuildLookup(q);
        } else if constexpr (std::is_same_v<Q, ListMoviesQuery>) {
            return BuildList(q);
        } else if constexpr (std::is_same_v<Q, PersonMoviesQuery>) {
            return BuildPersonMovies(q);
        } else {
            return BuildStatistics(q);
        }
    }, query);
}

CypherStatement BuildPingCypher() {
    CypherStatement stmt;
    stmt.text = "RETURN 1 AS ok";
    return stmt;
}

} // namespace cinegraph
