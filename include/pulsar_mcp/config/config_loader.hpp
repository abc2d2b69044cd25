#pragma once

#include <pulsar_mcp/config/app_config.hpp>
#include <pulsar_mcp/core/log.hpp>
#include <pulsar_mcp/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pulsar_mcp {

// Parse a YAML config file into a BridgeConfig.
Result<BridgeConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse pulsar-mcp-bridge command-line arguments.
Result<BridgeCliArgs, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI overrides on top of the YAML (or default) config.
BridgeConfig MergeConfigs(const BridgeConfig& yaml_base, const BridgeCliArgs& cli);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const BridgeConfig& config);

// Log level from -v/-vv and debug_mode. debug_mode wins.
LogLevel ResolveLogLevel(const BridgeConfig& config, int verbosity);

// Environment lookup, std::getenv by default. Injected by tests.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Read PULSAR_BRIDGE_HOST and PULSAR_BRIDGE_PORT.
Result<RelayConfig, Error> LoadRelayConfigFromEnv(const EnvLookup& env = {});

} // namespace pulsar_mcp
