#include <catch2/catch_test_macros.hpp>

#include <cinegraph/graph/neo4j_codec.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace cinegraph;

namespace {

const std::string kEndpoint = "http://localhost:7474/db/neo4j/tx/commit";

CypherStatement OverlapStatement() {
    return BuildCypher(OverlapQuery{"Inception", Relationship::InGenre});
}

} // namespace

// ===========================================================================
// Request
// ===========================================================================

TEST_CASE("BuildTransactionRequest: statement and parameters", "[graph][codec]") {
    auto body = nlohmann::json::parse(BuildTransactionRequest(OverlapStatement()));

    REQUIRE(body.at("statements").size() == 1);
    const auto& stmt = body.at("statements")[0];
    CHECK(stmt.at("statement").get<std::string>().find("MATCH (anchor:Movie") == 0);
    CHECK(stmt.at("parameters").at("title") == "Inception");
}

TEST_CASE("BuildTransactionRequest: empty parameters is an object", "[graph][codec]") {
    auto body = nlohmann::json::parse(BuildTransactionRequest(BuildPingCypher()));
    CHECK(body.at("statements")[0].at("parameters").is_object());
}

// ===========================================================================
// Response decoding
// ===========================================================================

TEST_CASE("ParseTransactionResponse: overlap rows", "[graph][codec]") {
    const std::string body = R"({
        "results": [{
            "columns": ["movie", "shared_count", "shared_names"],
            "data": [
                {"row": [{"title": "Interstellar", "year": 2014, "rating": 8.6,
                          "tagline": null, "description": null},
                         1, ["Sci-Fi"]]},
                {"row": [{"title": "Heat", "year": 1995, "rating": 8},
                         2, ["Action", "Crime"]]}
            ]
        }],
        "errors": []
    })";

    auto r = ParseTransactionResponse(body, OverlapStatement(), kEndpoint);
    REQUIRE(r.IsOk());
    const auto& rows = r.Value();
    REQUIRE(rows.size() == 2);

    auto node = RowNode(rows[0], columns::kMovie);
    REQUIRE(node.IsOk());
    CHECK(node.Value()->label == "Movie");
    CHECK(node.Value()->GetString("title") == std::string("Interstellar"));
    CHECK_FALSE(node.Value()->properties.count("tagline"));
    CHECK(RowInt(rows[0], columns::kSharedCount).Value() == 1);

    CHECK(RowStrings(rows[1], columns::kSharedNames).Value() ==
          StringList{"Action", "Crime"});
    auto heat = MovieFromNode(*RowNode(rows[1], columns::kMovie).Value());
    REQUIRE(heat.IsOk());
    CHECK(heat.Value().rating == 8.0);
}

TEST_CASE("ParseTransactionResponse: empty data is zero rows", "[graph][codec]") {
    const std::string body =
        R"({"results":[{"columns":["movie","shared_count","shared_names"],"data":[]}],"errors":[]})";
    auto r = ParseTransactionResponse(body, OverlapStatement(), kEndpoint);
    REQUIRE(r.IsOk());
    CHECK(r.Value().empty());
}

TEST_CASE("ParseTransactionResponse: null lists drop null entries", "[graph][codec]") {
    auto stmt = BuildCypher(MovieLookupQuery{"Heat"});
    const std::string body = R"({
        "results": [{
            "columns": ["movie", "directors", "cast", "genres"],
            "data": [{"row": [{"title": "Heat"}, ["Michael Mann"], [null], []]}]
        }],
        "errors": []
    })";
    auto r = ParseTransactionResponse(body, stmt, kEndpoint);
    REQUIRE(r.IsOk());
    CHECK(RowStrings(r.Value()[0], columns::kCast).Value().empty());
    CHECK(RowStrings(r.Value()[0], columns::kDirectors).Value().size() == 1);
}

TEST_CASE("ParseTransactionResponse: statistics scalars", "[graph][codec]") {
    auto stmt = BuildCypher(StatisticsQuery{});
    const std::string body = R"({
        "results": [{
            "columns": ["movies", "people", "genre_count", "relationships"],
            "data": [{"row": [6, 8, 6, 24]}]
        }],
        "errors": []
    })";
    auto r = ParseTransactionResponse(body, stmt, kEndpoint);
    REQUIRE(r.IsOk());
    CHECK(RowInt(r.Value()[0], columns::kRelationships).Value() == 24);
}

// ===========================================================================
// Errors
// ===========================================================================

TEST_CASE("ParseTransactionResponse: store errors are classified", "[graph][codec]") {
    const std::string body = R"({
        "results": [],
        "errors": [{"code": "Neo.ClientError.Statement.SyntaxError",
                    "message": "Invalid input"}]
    })";
    auto r = ParseTransactionResponse(body, OverlapStatement(), kEndpoint);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Query);
    CHECK(r.Error().store_error == std::string("Neo.ClientError.Statement.SyntaxError"));
    CHECK(r.Error().message == "Invalid input");
    CHECK(r.Error().endpoint == kEndpoint);
}

TEST_CASE("ParseTransactionResponse: malformed bodies", "[graph][codec]") {
    auto stmt = OverlapStatement();
    CHECK(ParseTransactionResponse("not json", stmt, kEndpoint).IsErr());
    CHECK(ParseTransactionResponse("[]", stmt, kEndpoint).IsErr());
    CHECK(ParseTransactionResponse(R"({"results":[]})", stmt, kEndpoint).IsErr());

    auto mismatch = ParseTransactionResponse(
        R"({"results":[{"columns":["movie","shared_count"],"data":[{"row":[{"title":"x"}]}]}]})",
        stmt, kEndpoint);
    REQUIRE(mismatch.IsErr());
    CHECK(mismatch.Error().category == ErrorCategory::Query);
    CHECK(mismatch.Error().message.find("row does not match columns") != std::string::npos);

    auto bare_error = ParseTransactionResponse(
        R"({"results":[],"errors":["boom"]})", stmt, kEndpoint);
    REQUIRE(bare_error.IsErr());
    CHECK(bare_error.Error().category == ErrorCategory::Query);
    CHECK(bare_error.Error().message.find("error entry is not an object") != std::string::npos);

    auto numeric_code = ParseTransactionResponse(
        R"({"results":[],"errors":[{"code":42,"message":"bad"}]})", stmt, kEndpoint);
    REQUIRE(numeric_code.IsErr());
    CHECK(numeric_code.Error().category == ErrorCategory::Query);
    CHECK(numeric_code.Error().message.find("must be strings") != std::string::npos);

    auto numeric_message = ParseTransactionResponse(
        R"({"results":[],"errors":[{"code":"Neo.ClientError.X","message":[1]}]})",
        stmt, kEndpoint);
    CHECK(numeric_message.IsErr());
}

TEST_CASE("ParseTransactionResponse: error without a message", "[graph][codec]") {
    auto r = ParseTransactionResponse(
        R"({"results":[],"errors":[{"code":"Neo.TransientError.General.OutOfMemoryError"}]})",
        OverlapStatement(), kEndpoint);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::StoreUnavailable);
    CHECK(r.Error().message == "query failed");
}

TEST_CASE("ParseTransactionResponse: node column must be a map", "[graph][codec]") {
    const std::string body = R"({
        "results": [{"columns": ["movie", "shared_count", "shared_names"],
                     "data": [{"row": ["Inception", 1, []]}]}],
        "errors": []
    })";
    auto r = ParseTransactionResponse(body, OverlapStatement(), kEndpoint);
    REQUIRE(r.IsErr());
    CHECK(r.Error().message.find("Column 'movie'") != std::string::npos);
}

TEST_CASE("CategoryFromNeo4jCode", "[graph][codec]") {
    CHECK(CategoryFromNeo4jCode("Neo.ClientError.Security.Unauthorized") ==
          ErrorCategory::StoreUnavailable);
    CHECK(CategoryFromNeo4jCode("Neo.ClientError.Transaction.TransactionTimedOut") ==
          ErrorCategory::Timeout);
    CHECK(CategoryFromNeo4jCode("Neo.TransientError.General.DatabaseUnavailable") ==
          ErrorCategory::StoreUnavailable);
    CHECK(CategoryFromNeo4jCode("Neo.ClientError.Statement.SyntaxError") ==
          ErrorCategory::Query);
    CHECK(CategoryFromNeo4jCode("") == ErrorCategory::Query);
}
