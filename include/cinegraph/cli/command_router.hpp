#pragma once

#include <cinegraph/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// CommandArgs - parsed command-line arguments for a specific command.
// ---------------------------------------------------------------------------
struct CommandArgs {
    std::string group;                   // e.g. "recommend", "movie", "graph"
    std::string action;                  // e.g. "combined", "show", "stats"
    std::vector<std::string> positional; // remaining positional arguments
    std::map<std::string, std::string> flags; // --key=value pairs
};

// Returns 0 on success, non-zero exit code on failure.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;        // e.g. "limit"
    std::string placeholder; // e.g. "<n>"
    std::string description;
    bool required = false;
};

struct CommandHelp {
    std::string usage;            // e.g. "cinegraph movie show <title>"
    std::string args_description; // e.g. "<title>    Exact movie title"
    std::string long_description; // paragraph below usage (optional)
    std::vector<FlagHelp> flags;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string group;
    std::string action;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter - two-level dispatch for CLI commands.
//
// Commands are registered as group/action pairs. The router parses argv,
// extracts the group and action, and dispatches to the registered handler.
//
// Usage:
//   CommandRouter router;
//   router.Register("movie", "show", "Show one movie", handler);
//   return router.Dispatch(argc, argv);
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    CommandRouter() = default;

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler,
                  std::optional<CommandHelp> help = std::nullopt);

    void SetGroupDescription(const std::string& group,
                             const std::string& description);

    void SetGroupExamples(const std::string& group,
                          std::vector<std::string> examples);

    // When the parsed action is not a registered action of the group, the
    // default action runs and the parsed token becomes positional[0].
    // Example: "cinegraph recommend Inception" runs recommend:combined.
    void SetDefaultAction(const std::string& group, const std::string& action);

    // Parse argv and dispatch to the matching handler.
    // Returns the handler's exit code, or 1 on a routing error.
    // Intercepts --help/-h at group and command levels.
    int Dispatch(int argc, const char* const* argv,
                 std::ostream& out, std::ostream& err) const;
    int Dispatch(int argc, const char* const* argv) const;

    static Result<CommandArgs, std::string> Parse(int argc, const char* const* argv);

    // True for flags that never take a value (--json, --color, ...).
    // Shared by Parse and IsNewStyleCommand in the executor.
    static bool IsBooleanFlag(std::string_view arg);

    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;
    [[nodiscard]] std::string GroupDescription(const std::string& group) const;
    [[nodiscard]] std::vector<std::string> GroupExamples(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group,
                          const std::string& action,
                          std::ostream& out) const;

private:
    void ReportError(const std::string& message, bool json_mode,
                     const std::string& group_for_help, std::ostream& err) const;

    // Key: "group:action"
    std::map<std::string, CommandInfo> commands_;
    std::map<std::string, std::string> group_descriptions_;
    std::map<std::string, std::vector<std::string>> group_examples_;
    std::map<std::string, std::string> default_actions_;
};

} // namespace cinegraph
