#pragma once

#include <cinegraph/config/app_config.hpp>
#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/i_graph_store.hpp>
#include <cinegraph/recommend/ranking.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// StepOutcome - outcome of a workflow phase.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

// ---------------------------------------------------------------------------
// StepResult - outcome + timing for a single workflow step.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
};

// ---------------------------------------------------------------------------
// RequestOutcome - result of one configured recommendation request.
// ---------------------------------------------------------------------------
struct RequestOutcome {
    std::string title;
    std::string strategy;
    bool success = false;
    std::string message;
    std::chrono::milliseconds elapsed{0};
    std::vector<ScoredCandidate> recommendations;
    std::optional<Error> error;
};

// ---------------------------------------------------------------------------
// BatchResult - aggregated results of a batch run.
// ---------------------------------------------------------------------------
struct BatchResult {
    bool success = false;
    StepResult connectivity;
    std::vector<RequestOutcome> outcomes;
    std::string summary;
    std::chrono::milliseconds total_duration{0};
    std::optional<Error> first_error;

    // 0 on success, else the exit code of the first error (1 if none).
    [[nodiscard]] int ExitCode() const;
};

// ---------------------------------------------------------------------------
// BatchRecommendWorkflow - ping the store, then run every request of
// config.requests in order. A failed request does not stop the ones after
// it; a failed ping stops the run.
//
// The store and config must outlive this object.
// ---------------------------------------------------------------------------
class BatchRecommendWorkflow {
public:
    BatchRecommendWorkflow(IGraphStore& store, const AppConfig& config);

    ~BatchRecommendWorkflow();

    // Non-copyable, non-movable.
    BatchRecommendWorkflow(const BatchRecommendWorkflow&) = delete;
    BatchRecommendWorkflow& operator=(const BatchRecommendWorkflow&) = delete;
    BatchRecommendWorkflow(BatchRecommendWorkflow&&) = delete;
    BatchRecommendWorkflow& operator=(BatchRecommendWorkflow&&) = delete;

    // Err only when there is nothing to run.
    [[nodiscard]] Result<BatchResult, Error> Execute();

private:
    IGraphStore& store_;
    const AppConfig& config_;

    StepResult RunConnectivityCheck(std::optional<Error>& error);
    RequestOutcome RunRequest(const RecommendRequestConfig& request);
};

} // namespace cinegraph
