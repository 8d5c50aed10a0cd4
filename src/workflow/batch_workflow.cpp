#include <cinegraph/workflow/batch_workflow.hpp>

#include <cinegraph/catalog/movie_catalog.hpp>
#include <cinegraph/core/log.hpp>
#include <cinegraph/recommend/recommender.hpp>

#include <sstream>

namespace cinegraph {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

int BatchResult::ExitCode() const {
    if (success) {
        return 0;
    }
    return first_error ? first_error->ExitCode() : 1;
}

BatchRecommendWorkflow::BatchRecommendWorkflow(IGraphStore& store, const AppConfig& config)
    : store_(store), config_(config) {}

BatchRecommendWorkflow::~BatchRecommendWorkflow() = default;

Result<BatchResult, Error> BatchRecommendWorkflow::Execute() {
    if (config_.requests.empty()) {
        return Result<BatchResult, Error>::Err(Error::InvalidArgument(
            "BatchRecommend",
            "No requests to run: pass --title or list them under 'requests:' in the config"));
    }

    auto total_start = Clock::now();
    BatchResult result;

    // Step 1: Connectivity.
    result.connectivity = RunConnectivityCheck(result.first_error);
    if (result.connectivity.outcome == StepOutcome::Failed) {
        result.success = false;
        result.summary = "Store unreachable: " + result.connectivity.message;
        result.total_duration = Elapsed(total_start);
        return Result<BatchResult, Error>::Ok(std::move(result));
    }

    // Step 2: Each request, in config order.
    int succeeded = 0;
    int failed = 0;
    for (const auto& request : config_.requests) {
        auto outcome = RunRequest(request);
        if (outcome.success) {
            ++succeeded;
        } else {
            ++failed;
            if (!result.first_error && outcome.error) {
                result.first_error = outcome.error;
            }
        }
        result.outcomes.push_back(std::move(outcome));
    }

    result.success = failed == 0;
    result.total_duration = Elapsed(total_start);

    std::ostringstream oss;
    oss << succeeded << " succeeded, " << failed << " failed";
    result.summary = oss.str();
    LogInfo("batch", result.summary);

    return Result<BatchResult, Error>::Ok(std::move(result));
}

StepResult BatchRecommendWorkflow::RunConnectivityCheck(std::optional<Error>& error) {
    auto start = Clock::now();
    QueryOptions options;
    options.timeout = std::chrono::milliseconds(config_.timeout_ms);

    auto ping = VerifyConnectivity(store_, options);
    if (ping.IsErr()) {
        error = ping.Error();
        return StepResult{"connect", StepOutcome::Failed, ping.Error().ToString(),
                          Elapsed(start)};
    }
    return StepResult{"connect", StepOutcome::Completed,
                      "connected to " + store_.Describe(), Elapsed(start)};
}

RequestOutcome BatchRecommendWorkflow::RunRequest(const RecommendRequestConfig& request) {
    auto start = Clock::now();
    RequestOutcome outcome;
    outcome.title = request.title;
    outcome.strategy = request.strategy;

    auto strategy = ParseStrategy(request.strategy);
    if (strategy.IsErr()) {
        outcome.message = strategy.Error().message;
        outcome.error = strategy.Error();
        outcome.elapsed = Elapsed(start);
        return outcome;
    }

    RecommendRequest call;
    call.title = request.title;
    call.strategy = strategy.Value();
    call.limit = request.limit;
    call.timeout = std::chrono::milliseconds(config_.timeout_ms);

    Recommender recommender(store_, config_.ranking);
    auto ranked = recommender.Recommend(call);
    outcome.elapsed = Elapsed(start);
    if (ranked.IsErr()) {
        LogWarn("batch", "'" + request.title + "' failed: " + ranked.Error().ToString());
        outcome.message = ranked.Error().ToString();
        outcome.error = ranked.Error();
        return outcome;
    }

    outcome.recommendations = std::move(ranked).Value();
    outcome.success = true;
    outcome.message = std::to_string(outcome.recommendations.size()) + " recommendation(s)";
    return outcome;
}

} // namespace cinegraph
