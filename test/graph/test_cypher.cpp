#include <catch2/catch_test_macros.hpp>

#include <cinegraph/graph/cypher.hpp>

#include <string>

using namespace cinegraph;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ===========================================================================
// Overlap
// ===========================================================================

TEST_CASE("BuildCypher: genre overlap walks out through IN_GENRE", "[graph][cypher]") {
    auto stmt = BuildCypher(OverlapQuery{"Inception", Relationship::InGenre});

    CHECK(Contains(stmt.text, "(anchor:Movie {title: $title})-[:IN_GENRE]->(shared:Genre)"));
    CHECK(Contains(stmt.text, "(shared:Genre)<-[:IN_GENRE]-(movie:Movie)"));
    CHECK(Contains(stmt.text, "movie <> anchor"));
    CHECK(Contains(stmt.text, "COUNT(DISTINCT shared) AS shared_count"));
    CHECK(stmt.parameters.at("title") == "Inception");
    CHECK(stmt.node_columns.at("movie") == "Movie");
}

TEST_CASE("BuildCypher: cast overlap walks in through ACTED_IN", "[graph][cypher]") {
    auto stmt = BuildCypher(OverlapQuery{"Titanic", Relationship::ActedIn});

    CHECK(Contains(stmt.text, "(anchor:Movie {title: $title})<-[:ACTED_IN]-(shared:Person)"));
    CHECK(Contains(stmt.text, "(shared:Person)-[:ACTED_IN]->(movie:Movie)"));
    CHECK(Contains(stmt.text, "COLLECT(DISTINCT shared.name) AS shared_names"));
}

TEST_CASE("BuildCypher: titles are parameters, never text", "[graph][cypher]") {
    const std::string hostile = "x'}) DETACH DELETE (n) //";
    auto stmt = BuildCypher(OverlapQuery{hostile, Relationship::InGenre});
    CHECK_FALSE(Contains(stmt.text, hostile));
    CHECK(stmt.parameters.at("title") == hostile);

    auto lookup = BuildCypher(MovieLookupQuery{hostile});
    CHECK_FALSE(Contains(lookup.text, hostile));

    auto person = BuildCypher(PersonMoviesQuery{hostile, Relationship::ActedIn});
    CHECK_FALSE(Contains(person.text, hostile));
    CHECK(person.parameters.at("name") == hostile);
}

// ===========================================================================
// Catalog queries
// ===========================================================================

TEST_CASE("BuildCypher: movie lookup collects directors, cast and genres", "[graph][cypher]") {
    auto stmt = BuildCypher(MovieLookupQuery{"Heat"});
    CHECK(Contains(stmt.text, "AS directors"));
    CHECK(Contains(stmt.text, "AS cast"));
    CHECK(Contains(stmt.text, "AS genres"));
    CHECK(Contains(stmt.text, "LIMIT 1"));
    CHECK(stmt.parameters.at("title") == "Heat");
}

TEST_CASE("BuildCypher: list movies has no parameters", "[graph][cypher]") {
    auto stmt = BuildCypher(ListMoviesQuery{});
    CHECK(stmt.parameters.empty());
    CHECK(Contains(stmt.text, "ORDER BY movie.title"));
}

TEST_CASE("BuildCypher: person movies by direction", "[graph][cypher]") {
    auto directed = BuildCypher(PersonMoviesQuery{"Christopher Nolan", Relationship::Directed});
    CHECK(Contains(directed.text, "(person:Person {name: $name})-[:DIRECTED]->(movie:Movie)"));
    CHECK(Contains(directed.text, "ORDER BY movie.year DESC, movie.title"));
}

TEST_CASE("BuildCypher: statistics returns the four counters", "[graph][cypher]") {
    auto stmt = BuildCypher(StatisticsQuery{});
    CHECK(Contains(stmt.text, "RETURN movies, people, genre_count, relationships"));
    CHECK(stmt.node_columns.empty());
}

TEST_CASE("BuildPingCypher: trivial statement", "[graph][cypher]") {
    auto stmt = BuildPingCypher();
    CHECK(stmt.text == "RETURN 1 AS ok");
    CHECK(stmt.parameters.empty());
}
