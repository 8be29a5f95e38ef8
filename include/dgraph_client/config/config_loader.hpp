#pragma once

#include <dgraph_client/config/app_config.hpp>
#include <dgraph_client/core/result.hpp>

#include <string>
#include <string_view>

namespace dgraph_client {

// Parse a YAML config file into an AppConfig. Durations are milliseconds.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI flags (subcommand already stripped) into an AppConfig.
// --connect expands a dgraph:// connection string into the connection block.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Resolve password_env: if password is empty and password_env is set,
// read the environment variable and populate password.
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace dgraph_client
