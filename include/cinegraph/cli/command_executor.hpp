#pragma once

#include <cinegraph/cli/command_router.hpp>
#include <cinegraph/config/config_loader.hpp>
#include <cinegraph/graph/store_factory.hpp>

#include <iostream>
#include <ostream>

namespace cinegraph {

// ---------------------------------------------------------------------------
// CommandEnvironment - what command handlers reach outside the process for.
//
// Production code uses the defaults. Tests swap in a factory that returns a
// MockGraphStore, an env lookup over a fixed map and string streams.
// ---------------------------------------------------------------------------
struct CommandEnvironment {
    StoreFactory store_factory = CreateGraphStore;
    EnvLookup env_lookup;            // nullptr: std::getenv
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
};

// Register the recommend, movie, person and graph groups with the router.
void RegisterAllCommands(CommandRouter& router, CommandEnvironment env = {});

// Build the AppConfig for one command from its flags.
// Precedence: defaults < --config YAML < NEO4J_* environment < flags.
// The password_env indirection is resolved and the result validated.
[[nodiscard]] Result<AppConfig, Error> ConfigFromArgs(const CommandArgs& args,
                                                      const EnvLookup& lookup = nullptr);

// Print top-level help (all groups, global flags, exit codes).
// When color=true, uses ANSI escape codes for bold/dim formatting.
void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color);

// Check if argv contains a command group (recommend, movie, person, graph)
// rather than the batch form driven by a config file.
bool IsNewStyleCommand(int argc, const char* const* argv);

} // namespace cinegraph
