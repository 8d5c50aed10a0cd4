#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cinegraph/recommend/ranking.hpp>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

using namespace cinegraph;

namespace {

Candidate MakeCandidate(const std::string& title, int genres, int actors) {
    Candidate c;
    c.movie.title = title;
    c.shared_genre_count = genres;
    c.shared_actor_count = actors;
    return c;
}

std::vector<std::string> Titles(const std::vector<ScoredCandidate>& ranked) {
    std::vector<std::string> out;
    for (const auto& r : ranked) {
        out.push_back(r.movie.title);
    }
    return out;
}

} // namespace

// ===========================================================================
// ParseStrategy
// ===========================================================================

TEST_CASE("ParseStrategy: known names, any case", "[recommend][ranking]") {
    CHECK(ParseStrategy("genre").Value() == Strategy::Genre);
    CHECK(ParseStrategy("CAST").Value() == Strategy::Cast);
    CHECK(ParseStrategy("Combined").Value() == Strategy::Combined);
    CHECK(std::string(StrategyName(Strategy::Cast)) == "cast");
}

TEST_CASE("ParseStrategy: unknown name is InvalidArgument", "[recommend][ranking]") {
    auto r = ParseStrategy("popularity");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidArgument);
    CHECK(r.Error().message.find("popularity") != std::string::npos);
    CHECK(ParseStrategy("").IsErr());
}

// ===========================================================================
// ValidatePolicy
// ===========================================================================

TEST_CASE("ValidatePolicy", "[recommend][ranking]") {
    CHECK(ValidatePolicy(RankingPolicy{}).IsOk());
    CHECK(ValidatePolicy(RankingPolicy{0.0, 0.0, 1}).IsOk());
    CHECK(ValidatePolicy(RankingPolicy{-1.0, 3.0, 5}).IsErr());
    CHECK(ValidatePolicy(RankingPolicy{2.0, std::numeric_limits<double>::infinity(), 5}).IsErr());
    CHECK(ValidatePolicy(RankingPolicy{2.0, 3.0, 0}).IsErr());
}

// ===========================================================================
// Rank
// ===========================================================================

TEST_CASE("Rank: combined score uses the policy weights", "[recommend][ranking]") {
    auto ranked = Rank({MakeCandidate("Interstellar", 1, 0), MakeCandidate("Titanic", 0, 1)},
                       Strategy::Combined, RankingPolicy{}, 5);
    REQUIRE(ranked.size() == 2);
    CHECK(ranked[0].movie.title == "Titanic");
    CHECK(ranked[0].composite_score == Catch::Approx(3.0));
    CHECK(ranked[1].composite_score == Catch::Approx(2.0));

    RankingPolicy genre_heavy{5.0, 1.0, 5};
    auto reweighted = Rank({MakeCandidate("Interstellar", 1, 0), MakeCandidate("Titanic", 0, 1)},
                           Strategy::Combined, genre_heavy, 5);
    CHECK(reweighted[0].movie.title == "Interstellar");
}

TEST_CASE("Rank: combined ties prefer more shared actors", "[recommend][ranking]") {
    // 3 genres * 2.0 == 2 actors * 3.0
    auto ranked = Rank({MakeCandidate("A Genre Match", 3, 0), MakeCandidate("Z Cast Match", 0, 2)},
                       Strategy::Combined, RankingPolicy{}, 5);
    CHECK(Titles(ranked) == std::vector<std::string>{"Z Cast Match", "A Genre Match"});
}

TEST_CASE("Rank: equal scores fall back to title", "[recommend][ranking]") {
    auto ranked = Rank({MakeCandidate("Heat", 1, 0), MakeCandidate("Alien", 1, 0),
                        MakeCandidate("Casino", 1, 0)},
                       Strategy::Genre, RankingPolicy{}, 5);
    CHECK(Titles(ranked) == std::vector<std::string>{"Alien", "Casino", "Heat"});
}

TEST_CASE("Rank: single-signal strategies score by their own count", "[recommend][ranking]") {
    auto genre = Rank({MakeCandidate("Heat", 2, 5), MakeCandidate("Alien", 3, 0)},
                      Strategy::Genre, RankingPolicy{}, 5);
    CHECK(genre[0].movie.title == "Alien");
    CHECK(genre[0].composite_score == Catch::Approx(3.0));

    auto cast = Rank({MakeCandidate("Heat", 2, 5), MakeCandidate("Alien", 3, 0)},
                     Strategy::Cast, RankingPolicy{}, 5);
    CHECK(cast[0].movie.title == "Heat");
    CHECK(cast[0].composite_score == Catch::Approx(5.0));
}

TEST_CASE("Rank: limit truncates after ordering", "[recommend][ranking]") {
    std::vector<Candidate> candidates;
    for (int i = 1; i <= 10; ++i) {
        candidates.push_back(MakeCandidate("Movie " + std::to_string(i), i, 0));
    }
    auto ranked = Rank(candidates, Strategy::Genre, RankingPolicy{}, 3);
    CHECK(Titles(ranked) == std::vector<std::string>{"Movie 10", "Movie 9", "Movie 8"});

    CHECK(Rank(candidates, Strategy::Genre, RankingPolicy{}, 50).size() == 10);
    CHECK(Rank({}, Strategy::Combined, RankingPolicy{}, 5).empty());
}

TEST_CASE("Rank: output does not depend on input order", "[recommend][ranking]") {
    std::vector<Candidate> candidates = {
        MakeCandidate("Heat", 1, 1), MakeCandidate("Alien", 2, 0),
        MakeCandidate("Casino", 0, 2), MakeCandidate("Drive", 1, 0),
    };
    auto expected = Titles(Rank(candidates, Strategy::Combined, RankingPolicy{}, 4));

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) { return a.movie.title > b.movie.title; });
    do {
        CHECK(Titles(Rank(candidates, Strategy::Combined, RankingPolicy{}, 4)) == expected);
    } while (std::prev_permutation(candidates.begin(), candidates.end(),
                                   [](const Candidate& a, const Candidate& b) {
                                       return a.movie.title < b.movie.title;
                                   }));
}
