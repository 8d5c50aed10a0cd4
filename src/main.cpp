#include <cinegraph/cli/command_executor.hpp>
#include <cinegraph/cli/command_router.hpp>
#include <cinegraph/config/config_loader.hpp>
#include <cinegraph/core/log.hpp>
#include <cinegraph/core/terminal.hpp>
#include <cinegraph/core/version.hpp>
#include <cinegraph/graph/store_factory.hpp>
#include <cinegraph/workflow/batch_workflow.hpp>

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 1;

// Resolve color mode for help output (stdout-based, before logger init).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color" || arg == "--color=true") force_color = true;
        if (arg == "--no-color" || arg == "--color=false") force_no_color = true;
    }
    if (cinegraph::NoColorEnvSet()) force_no_color = true;
    return !force_no_color && (force_color || cinegraph::IsStdoutTty());
}

// Check for --version before the first positional (group) argument.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "cinegraph " << cinegraph::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

// Check for --help/-h before the first positional (group) argument.
// Returns true if help was printed. Group-level help belongs to the router.
bool HandleHelpFlag(int argc, const char* const* argv) {
    if (cinegraph::IsNewStyleCommand(argc, argv)) {
        return false;
    }
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--help" || arg == "-h") {
            cinegraph::CommandRouter router;
            cinegraph::RegisterAllCommands(router);
            cinegraph::PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
            return true;
        }
    }
    return false;
}

// Value of "--name value" or "--name=value", if present.
std::optional<std::string> FindFlagValue(int argc, const char* const* argv,
                                         std::string_view name) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == name && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
        if (arg.size() > name.size() && arg.substr(0, name.size()) == name &&
            arg[name.size()] == '=') {
            return std::string(arg.substr(name.size() + 1));
        }
    }
    return std::nullopt;
}

// Console sink, teed into a JSON-lines file when a log file is configured.
std::unique_ptr<cinegraph::ILogSink> MakeLogSink(bool use_color,
                                                 const std::optional<std::string>& log_file) {
    auto console = std::make_unique<cinegraph::ColorConsoleSink>(use_color);
    if (!log_file) {
        return console;
    }
    auto file = std::make_unique<cinegraph::FileSink>(*log_file);
    if (!file->IsOpen()) {
        std::cerr << "Warning: cannot open log file " << *log_file << "\n";
        return console;
    }
    std::vector<std::unique_ptr<cinegraph::ILogSink>> sinks;
    sinks.push_back(std::move(console));
    sinks.push_back(std::move(file));
    return std::make_unique<cinegraph::TeeSink>(std::move(sinks));
}

// Drop the flags main consumes itself, so LoadFromCli sees only its own.
std::vector<const char*> StripGlobalFlags(int argc, const char* const* argv) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "-vv" || arg == "--color" || arg == "--no-color" ||
            arg == "--color=true" || arg == "--color=false") {
            continue;
        }
        stripped.push_back(argv[i]);
    }
    return stripped;
}

void PrintError(const cinegraph::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

void PrintResult(const cinegraph::BatchResult& result, bool json_output, bool quiet) {
    if (json_output) {
        nlohmann::json doc;
        doc["success"] = result.success;
        doc["summary"] = result.summary;
        doc["elapsed_ms"] = result.total_duration.count();
        doc["requests"] = nlohmann::json::array();
        for (const auto& r : result.outcomes) {
            nlohmann::json entry = {{"title", r.title},
                                    {"strategy", r.strategy},
                                    {"success", r.success},
                                    {"message", r.message},
                                    {"elapsed_ms", r.elapsed.count()}};
            entry["recommendations"] = nlohmann::json::array();
            for (const auto& rec : r.recommendations) {
                nlohmann::json item = {{"title", rec.movie.title},
                                       {"shared_genre_count", rec.shared_genre_count},
                                       {"shared_actor_count", rec.shared_actor_count},
                                       {"composite_score", rec.composite_score}};
                item["year"] = rec.movie.year ? nlohmann::json(*rec.movie.year)
                                              : nlohmann::json(nullptr);
                item["rating"] = rec.movie.rating ? nlohmann::json(*rec.movie.rating)
                                                  : nlohmann::json(nullptr);
                entry["recommendations"].push_back(std::move(item));
            }
            doc["requests"].push_back(std::move(entry));
        }
        std::cout << doc.dump() << "\n";
        return;
    }
    if (quiet) {
        return;
    }

    if (result.connectivity.outcome == cinegraph::StepOutcome::Failed) {
        std::cout << "[FAILED] connect - " << result.connectivity.message << "\n";
    }
    for (const auto& r : result.outcomes) {
        const char* status = r.success ? "OK" : "FAILED";
        std::cout << "[" << status << "] " << r.title << " (" << r.strategy << ")"
                  << " - " << r.message << " (" << r.elapsed.count() << "ms)\n";
        for (size_t i = 0; i < r.recommendations.size(); ++i) {
            const auto& rec = r.recommendations[i];
            std::cout << "  " << (i + 1) << ". " << rec.movie.title;
            if (rec.movie.year) std::cout << " (" << *rec.movie.year << ")";
            std::cout << "  score " << std::fixed << std::setprecision(2)
                      << rec.composite_score << "\n";
        }
    }
    std::cout << "\n" << result.summary << "\n";
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace cinegraph;

    // No arguments: print top-level help.
    if (argc == 1) {
        CommandRouter router;
        RegisterAllCommands(router);
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    if (HandleHelpFlag(argc, argv)) {
        return kExitSuccess;
    }

    // Parse verbosity and color flags.
    auto log_level = LogLevel::Warn;
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "-vv") { log_level = LogLevel::Debug; }
        else if (arg == "-v" || arg == "--verbose") { log_level = LogLevel::Info; }
        else if (arg == "--color" || arg == "--color=true") { force_color = true; }
        else if (arg == "--no-color" || arg == "--color=false") { force_no_color = true; }
    }
    bool use_color = ResolveColor(force_color, force_no_color, IsStderrTty());
    auto log_file = FindFlagValue(argc, argv, "--log-file");
    InitGlobalLogger(MakeLogSink(use_color, log_file), log_level);

    // Command groups (recommend, movie, person, graph) via CommandRouter.
    if (IsNewStyleCommand(argc, argv)) {
        CommandRouter router;
        RegisterAllCommands(router);
        return router.Dispatch(argc, argv);
    }

    // === Batch path: -c config.yaml and/or --title ===

    auto stripped = StripGlobalFlags(argc, argv);
    auto stripped_argc = static_cast<int>(stripped.size());
    auto stripped_argv = stripped.data();

    auto cli_result = LoadFromCli(stripped_argc, stripped_argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error(), false);
        std::cerr << "Run 'cinegraph --help' for usage.\n";
        return kExitUsage;
    }
    auto cli_config = std::move(cli_result).Value();

    // Precedence: defaults < YAML < environment < flags.
    AppConfig config;
    auto config_path = FindFlagValue(stripped_argc, stripped_argv, "--config");
    if (!config_path) {
        config_path = FindFlagValue(stripped_argc, stripped_argv, "-c");
    }
    if (config_path) {
        auto yaml_result = LoadFromYaml(*config_path);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error(), cli_config.json_output);
            return yaml_result.Error().ExitCode();
        }
        config = std::move(yaml_result).Value();
    }
    config = MergeConfigs(MergeConfigs(config, LoadFromEnv()), cli_config);

    auto resolved = ResolvePasswordEnv(std::move(config));
    if (resolved.IsErr()) {
        PrintError(resolved.Error(), cli_config.json_output);
        return resolved.Error().ExitCode();
    }
    config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error(), config.json_output);
        return valid.Error().ExitCode();
    }

    // The config file may name a log file the flags did not.
    if (!log_file && config.log_file) {
        InitGlobalLogger(MakeLogSink(use_color, config.log_file), log_level);
    }

    auto store = CreateGraphStore(config);
    if (store.IsErr()) {
        PrintError(store.Error(), config.json_output);
        return store.Error().ExitCode();
    }

    BatchRecommendWorkflow workflow(*store.Value(), config);
    auto result = workflow.Execute();
    if (result.IsErr()) {
        PrintError(result.Error(), config.json_output);
        return result.Error().ExitCode();
    }

    const auto& batch = result.Value();
    PrintResult(batch, config.json_output, config.quiet);
    return batch.ExitCode();
}
