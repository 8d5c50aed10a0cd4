#include <catch2/catch_test_macros.hpp>

#include <cinegraph/graph/graph_loader.hpp>
#include <cinegraph/graph/in_memory_store.hpp>
#include <cinegraph/workflow/batch_workflow.hpp>
#include "mocks/mock_graph_store.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace cinegraph;
using namespace cinegraph::testing;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/workflow
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

// Helper to build an AppConfig with the given requests.
AppConfig MakeConfig(std::vector<RecommendRequestConfig> requests) {
    AppConfig config;
    config.timeout_ms = 1234;
    config.requests = std::move(requests);
    return config;
}

RecommendRequestConfig Request(const std::string& title, const std::string& strategy,
                               std::optional<int> limit = std::nullopt) {
    RecommendRequestConfig request;
    request.title = title;
    request.strategy = strategy;
    request.limit = limit;
    return request;
}

} // namespace

// ===========================================================================
// Preconditions
// ===========================================================================

TEST_CASE("BatchRecommendWorkflow: no requests is an error", "[workflow][batch]") {
    MockGraphStore mock;
    auto config = MakeConfig({});
    BatchRecommendWorkflow workflow(mock, config);

    auto r = workflow.Execute();
    REQUIRE(r.IsErr());
    CHECK(r.Error().operation == "BatchRecommend");
    CHECK(r.Error().category == ErrorCategory::InvalidArgument);
    CHECK(mock.PingCallCount() == 0);
}

TEST_CASE("BatchRecommendWorkflow: unreachable store stops the run", "[workflow][batch]") {
    MockGraphStore mock;
    mock.EnqueuePing(Result<void, Error>::Err(StoreDownError()));
    auto config = MakeConfig({Request("Inception", "genre")});
    BatchRecommendWorkflow workflow(mock, config);

    auto r = workflow.Execute();
    REQUIRE(r.IsOk());
    const auto& result = r.Value();
    CHECK_FALSE(result.success);
    CHECK(result.connectivity.outcome == StepOutcome::Failed);
    CHECK(result.summary.rfind("Store unreachable: ", 0) == 0);
    CHECK(result.outcomes.empty());
    CHECK(result.ExitCode() == 4);
    CHECK(mock.ExecuteCallCount() == 0);
}

// ===========================================================================
// Requests
// ===========================================================================

TEST_CASE("BatchRecommendWorkflow: all requests succeed over the dataset", "[workflow][batch]") {
    auto snapshot = LoadGraphDataset(TestDataPath("movies.yaml"));
    REQUIRE(snapshot.IsOk());
    InMemoryGraphStore store(
        std::make_shared<const GraphSnapshot>(std::move(snapshot).Value()), "movies.yaml");

    auto config = MakeConfig({Request("Inception", "combined", 3),
                              Request("Titanic", "cast")});
    BatchRecommendWorkflow workflow(store, config);

    auto r = workflow.Execute();
    REQUIRE(r.IsOk());
    const auto& result = r.Value();
    CHECK(result.success);
    CHECK(result.ExitCode() == 0);
    CHECK(result.summary == "2 succeeded, 0 failed");
    CHECK(result.connectivity.outcome == StepOutcome::Completed);

    REQUIRE(result.outcomes.size() == 2);
    CHECK(result.outcomes[0].title == "Inception");
    CHECK(result.outcomes[0].recommendations.size() == 3);
    CHECK(result.outcomes[0].recommendations[0].movie.title == "Interstellar");
    CHECK(result.outcomes[1].strategy == "cast");
    CHECK_FALSE(result.outcomes[1].error.has_value());
}

TEST_CASE("BatchRecommendWorkflow: a failed request does not stop later ones",
          "[workflow][batch]") {
    MockGraphStore mock;
    mock.EnqueueError(StoreTimeoutError());
    mock.EnqueueRows({OverlapRow("Heat", 2, {"Action", "Crime"}, 1995)});
    auto config = MakeConfig({Request("Inception", "genre"), Request("The Dark Knight", "genre")});
    BatchRecommendWorkflow workflow(mock, config);

    auto r = workflow.Execute();
    REQUIRE(r.IsOk());
    const auto& result = r.Value();
    CHECK_FALSE(result.success);
    CHECK(result.summary == "1 succeeded, 1 failed");
    REQUIRE(result.outcomes.size() == 2);
    CHECK_FALSE(result.outcomes[0].success);
    REQUIRE(result.outcomes[0].error.has_value());
    CHECK(result.outcomes[0].error->category == ErrorCategory::Timeout);
    CHECK(result.outcomes[1].success);
    CHECK(result.outcomes[1].recommendations.size() == 1);
    CHECK(result.ExitCode() == 5);
    CHECK(mock.ExecuteCallCount() == 2);
}

TEST_CASE("BatchRecommendWorkflow: exit code follows the first error", "[workflow][batch]") {
    MockGraphStore mock;
    mock.EnqueueError(StoreDownError());
    mock.EnqueueError(StoreTimeoutError());
    auto config = MakeConfig({Request("Inception", "cast"), Request("Heat", "cast")});
    BatchRecommendWorkflow workflow(mock, config);

    auto r = workflow.Execute();
    REQUIRE(r.IsOk());
    CHECK(r.Value().summary == "0 succeeded, 2 failed");
    REQUIRE(r.Value().first_error.has_value());
    CHECK(r.Value().first_error->category == ErrorCategory::StoreUnavailable);
    CHECK(r.Value().ExitCode() == 4);
}

TEST_CASE("BatchRecommendWorkflow: unknown strategy fails only its request",
          "[workflow][batch]") {
    MockGraphStore mock;
    mock.EnqueueRows({});
    auto config = MakeConfig({Request("Inception", "popularity"), Request("Heat", "genre")});
    BatchRecommendWorkflow workflow(mock, config);

    auto r = workflow.Execute();
    REQUIRE(r.IsOk());
    const auto& result = r.Value();
    REQUIRE(result.outcomes.size() == 2);
    CHECK_FALSE(result.outcomes[0].success);
    CHECK(result.outcomes[1].success);
    CHECK(result.outcomes[1].message == "0 recommendation(s)");
    CHECK(result.ExitCode() == 2);
    CHECK(mock.ExecuteCallCount() == 1);
}

TEST_CASE("BatchRecommendWorkflow: the configured timeout reaches the store",
          "[workflow][batch]") {
    MockGraphStore mock;
    mock.EnqueueRows({});
    auto config = MakeConfig({Request("Inception", "genre")});
    BatchRecommendWorkflow workflow(mock, config);

    auto r = workflow.Execute();
    REQUIRE(r.IsOk());
    REQUIRE(mock.PingCallCount() == 1);
    CHECK(mock.PingCalls()[0].timeout == std::chrono::milliseconds(1234));
    REQUIRE(mock.ExecuteCallCount() == 1);
    CHECK(mock.ExecuteCalls()[0].options.timeout == std::chrono::milliseconds(1234));
}
