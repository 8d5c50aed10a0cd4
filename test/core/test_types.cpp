#include <catch2/catch_test_macros.hpp>

#include <cinegraph/core/types.hpp>

#include <string>
#include <unordered_set>

using namespace cinegraph;

// ===========================================================================
// MovieTitle
// ===========================================================================

TEST_CASE("MovieTitle: valid title", "[types][title]") {
    auto r = MovieTitle::Create("The Dark Knight");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Value() == "The Dark Knight");
}

TEST_CASE("MovieTitle: surrounding whitespace is stripped", "[types][title]") {
    auto r = MovieTitle::Create("  Inception\t");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Value() == "Inception");
}

TEST_CASE("MovieTitle: empty or blank is rejected", "[types][title]") {
    CHECK(MovieTitle::Create("").IsErr());
    auto r = MovieTitle::Create("   ");
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "Movie title must not be empty");
}

TEST_CASE("MovieTitle: punctuation and unicode are kept", "[types][title]") {
    CHECK(MovieTitle::Create("Am\xC3\xA9lie").IsOk());
    CHECK(MovieTitle::Create("Mission: Impossible - Fallout").IsOk());
    CHECK(MovieTitle::Create("Se7en").IsOk());
}

TEST_CASE("MovieTitle: length limit", "[types][title]") {
    CHECK(MovieTitle::Create(std::string(512, 'a')).IsOk());
    auto r = MovieTitle::Create(std::string(513, 'a'));
    REQUIRE(r.IsErr());
    CHECK(r.Error().find("512") != std::string::npos);
}

TEST_CASE("MovieTitle: control characters are rejected", "[types][title]") {
    CHECK(MovieTitle::Create("Heat\nII").IsErr());
    CHECK(MovieTitle::Create(std::string("Heat\x7F")).IsErr());
}

TEST_CASE("MovieTitle: equality, ordering and hashing", "[types][title]") {
    auto a = MovieTitle::Create("Heat").Value();
    auto b = MovieTitle::Create(" Heat ").Value();
    auto c = MovieTitle::Create("Inception").Value();
    CHECK(a == b);
    CHECK(a != c);
    CHECK(a < c);

    std::unordered_set<MovieTitle> seen{a, b, c};
    CHECK(seen.size() == 2);
}

// ===========================================================================
// PersonName
// ===========================================================================

TEST_CASE("PersonName: valid name", "[types][person]") {
    auto r = PersonName::Create("Leonardo DiCaprio");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Value() == "Leonardo DiCaprio");
}

TEST_CASE("PersonName: empty is rejected with its own message", "[types][person]") {
    auto r = PersonName::Create(" ");
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "Person name must not be empty");
}

TEST_CASE("PersonName: control characters are rejected", "[types][person]") {
    CHECK(PersonName::Create("Michael\tCaine").IsErr());
}

// ===========================================================================
// DatabaseName
// ===========================================================================

TEST_CASE("DatabaseName: valid names", "[types][database]") {
    CHECK(DatabaseName::Create("neo4j").IsOk());
    CHECK(DatabaseName::Create("movies").IsOk());
    CHECK(DatabaseName::Create("movies-2024.archive").IsOk());
}

TEST_CASE("DatabaseName: input is lowercased", "[types][database]") {
    auto r = DatabaseName::Create("Movies");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Value() == "movies");
}

TEST_CASE("DatabaseName: length bounds", "[types][database]") {
    CHECK(DatabaseName::Create("ab").IsErr());
    CHECK(DatabaseName::Create("abc").IsOk());
    CHECK(DatabaseName::Create(std::string(63, 'a')).IsOk());
    CHECK(DatabaseName::Create(std::string(64, 'a')).IsErr());
}

TEST_CASE("DatabaseName: must start with a letter", "[types][database]") {
    auto r = DatabaseName::Create("2movies");
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "Database name must start with a letter");
}

TEST_CASE("DatabaseName: invalid characters", "[types][database]") {
    CHECK(DatabaseName::Create("my_movies").IsErr());
    CHECK(DatabaseName::Create("my movies").IsErr());
}
