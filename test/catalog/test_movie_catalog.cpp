#include <catch2/catch_test_macros.hpp>

#include <cinegraph/catalog/movie_catalog.hpp>
#include <cinegraph/graph/graph_loader.hpp>
#include <cinegraph/graph/in_memory_store.hpp>

#include "mocks/mock_graph_store.hpp"

#include <memory>
#include <string>

using namespace cinegraph;
using namespace cinegraph::testing;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/catalog
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

std::unique_ptr<InMemoryGraphStore> MoviesStore() {
    auto snapshot = LoadGraphDataset(TestDataPath("movies.yaml"));
    REQUIRE(snapshot.IsOk());
    return std::make_unique<InMemoryGraphStore>(
        std::make_shared<const GraphSnapshot>(std::move(snapshot).Value()), "movies.yaml");
}

} // anonymous namespace

// ===========================================================================
// ListMovies
// ===========================================================================

TEST_CASE("ListMovies: every movie, ordered by title", "[catalog]") {
    auto store = MoviesStore();
    auto r = ListMovies(*store);
    REQUIRE(r.IsOk());
    const auto& movies = r.Value();
    REQUIRE(movies.size() == 6);
    CHECK(movies.front().title == "Heat");
    CHECK(movies.back().title == "Titanic");
}

TEST_CASE("ListMovies: orders rows the store returned unsorted", "[catalog]") {
    MockGraphStore store;
    Row b;
    b[columns::kMovie] = MovieNode("Titanic", 1997);
    Row a;
    a[columns::kMovie] = MovieNode("Heat", 1995);
    store.EnqueueRows({b, a});

    auto r = ListMovies(store);
    REQUIRE(r.IsOk());
    CHECK(r.Value()[0].title == "Heat");
}

// ===========================================================================
// GetMovieDetails
// ===========================================================================

TEST_CASE("GetMovieDetails: directors, cast and genres", "[catalog]") {
    auto store = MoviesStore();
    auto r = GetMovieDetails(*store, "Inception");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().has_value());
    const auto& details = *r.Value();

    CHECK(details.movie.year == 2010);
    CHECK(details.movie.tagline.has_value());
    CHECK(details.directors == std::vector<std::string>{"Christopher Nolan"});
    CHECK(details.cast == std::vector<std::string>{"Leonardo DiCaprio", "Michael Caine"});
    CHECK(details.genres == std::vector<std::string>{"Action", "Sci-Fi", "Thriller"});
}

TEST_CASE("GetMovieDetails: unknown movie is nullopt", "[catalog]") {
    auto store = MoviesStore();
    auto r = GetMovieDetails(*store, "Nonexistent Movie");
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().has_value());
}

TEST_CASE("GetMovieDetails: duplicate names from the store are collapsed", "[catalog]") {
    MockGraphStore store;
    Row row;
    row[columns::kMovie] = MovieNode("Heat", 1995);
    row[columns::kDirectors] = StringList{"Michael Mann", "Michael Mann"};
    row[columns::kCast] = StringList{"Robert De Niro", "Al Pacino"};
    row[columns::kGenres] = std::monostate{};
    store.EnqueueRows({row});

    auto r = GetMovieDetails(store, "Heat");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().has_value());
    CHECK(r.Value()->directors.size() == 1);
    CHECK(r.Value()->cast.front() == "Al Pacino");
    CHECK(r.Value()->genres.empty());
}

// ===========================================================================
// Person queries
// ===========================================================================

TEST_CASE("MoviesByActor: newest first", "[catalog]") {
    auto store = MoviesStore();
    auto r = MoviesByActor(*store, "Leonardo DiCaprio");
    REQUIRE(r.IsOk());
    const auto& movies = r.Value();
    REQUIRE(movies.size() == 3);
    CHECK(movies[0].movie.title == "Inception");
    CHECK(movies[1].movie.title == "The Departed");
    CHECK(movies[2].movie.title == "Titanic");
    CHECK(movies[2].genres == std::vector<std::string>{"Drama", "Romance"});
}

TEST_CASE("MoviesByDirector", "[catalog]") {
    auto store = MoviesStore();
    auto r = MoviesByDirector(*store, "Christopher Nolan");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == 3);
    CHECK(r.Value()[0].movie.title == "Interstellar");

    auto none = MoviesByDirector(*store, "Leonardo DiCaprio");
    REQUIRE(none.IsOk());
    CHECK(none.Value().empty());
}

TEST_CASE("MoviesByActor: unknown person is empty", "[catalog]") {
    auto store = MoviesStore();
    auto r = MoviesByActor(*store, "Nobody In Particular");
    REQUIRE(r.IsOk());
    CHECK(r.Value().empty());
}

// ===========================================================================
// Statistics and connectivity
// ===========================================================================

TEST_CASE("GetStatistics: counts from the dataset", "[catalog]") {
    auto store = MoviesStore();
    auto r = GetStatistics(*store);
    REQUIRE(r.IsOk());
    CHECK(r.Value().movies == 6);
    CHECK(r.Value().people == 8);
    CHECK(r.Value().genres == 6);
    CHECK(r.Value().relationships == 29);
}

TEST_CASE("GetStatistics: anything but one row is a Query error", "[catalog]") {
    MockGraphStore store;
    store.EnqueueRows({});
    auto r = GetStatistics(store);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Query);
}

TEST_CASE("Catalog: store errors propagate", "[catalog]") {
    MockGraphStore store;
    store.EnqueueError(StoreDownError());
    store.EnqueueError(StoreTimeoutError());

    auto list = ListMovies(store);
    REQUIRE(list.IsErr());
    CHECK(list.Error().category == ErrorCategory::StoreUnavailable);

    auto details = GetMovieDetails(store, "Heat");
    REQUIRE(details.IsErr());
    CHECK(details.Error().category == ErrorCategory::Timeout);
}

TEST_CASE("VerifyConnectivity: passes the ping result through", "[catalog]") {
    MockGraphStore store;
    CHECK(VerifyConnectivity(store).IsOk());

    store.EnqueuePing(Result<void, Error>::Err(StoreDownError()));
    QueryOptions options;
    options.timeout = std::chrono::milliseconds(500);
    auto r = VerifyConnectivity(store, options);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::StoreUnavailable);
    REQUIRE(store.PingCallCount() == 2);
    CHECK(store.PingCalls()[1].timeout == std::chrono::milliseconds(500));
}
