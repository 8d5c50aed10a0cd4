#pragma once

#include <cinegraph/config/app_config.hpp>
#include <cinegraph/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace cinegraph {

// Environment lookup; returns nullptr when the variable is unset.
using EnvLookup = std::function<const char*(const char*)>;

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse batch-mode CLI arguments into an AppConfig.
// --title/--strategy/--limit add a single request to the requests list.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Read NEO4J_URI, NEO4J_USERNAME, NEO4J_PASSWORD and NEO4J_DATABASE.
// Unset variables leave the defaults in place.
AppConfig LoadFromEnv(const EnvLookup& lookup = nullptr);

// Merge two configs: overrides take precedence over base.
// A field counts as set in overrides when it differs from the default.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides);

// Resolve password_env: if password is empty and password_env is set,
// read the environment variable and populate password.
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config,
                                            const EnvLookup& lookup = nullptr);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace cinegraph
