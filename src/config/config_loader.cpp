#include <pulsar_mcp/config/config_loader.hpp>

#include <pulsar_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace pulsar_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, ErrorCategory::Config};
}

std::optional<std::string> GetEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<BridgeConfig, Error> LoadFromYaml(std::string_view file_path) {
    BridgeConfig config;
    try {
        auto root = YAML::LoadFile(std::string(file_path));

        // -- Bridge --
        if (root["bridge"]) {
            const auto& bridge = root["bridge"];
            if (bridge["host"]) {
                config.host = bridge["host"].as<std::string>();
            }
            if (bridge["port"]) {
                config.port = bridge["port"].as<int>();
            }
            if (bridge["max_port_attempts"]) {
                config.max_port_attempts = bridge["max_port_attempts"].as<int>();
            }
            if (bridge["auto_start"]) {
                config.auto_start = bridge["auto_start"].as<bool>();
            }
        }

        // -- Options --
        if (root["debug_mode"]) {
            config.debug_mode = root["debug_mode"].as<bool>();
        }
        if (root["log_json"]) {
            config.log_json = root["log_json"].as<bool>();
        }
        if (root["project_paths"]) {
            for (const auto& path : root["project_paths"]) {
                config.project_paths.push_back(path.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<BridgeConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<BridgeConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<BridgeCliArgs, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("pulsar-mcp-bridge", kVersion);

    // Bridge flags
    program.add_argument("--host")
        .help("Interface the bridge listens on (default: 127.0.0.1)");
    program.add_argument("--port")
        .help("First port to try (default: 3000)")
        .scan<'i', int>();
    program.add_argument("--max-port-attempts")
        .help("How many consecutive ports to probe (default: 100)")
        .scan<'i', int>();
    program.add_argument("--project")
        .help("Project root folder (repeatable)")
        .append();

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--debug")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-json")
        .help("Log as JSON lines on stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v")
        .help("Info logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<BridgeCliArgs, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    BridgeCliArgs args;
    if (auto val = program.present("--config")) {
        args.config_file = *val;
    }
    if (auto val = program.present("--host")) {
        args.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        args.port = *val;
    }
    if (auto val = program.present<int>("--max-port-attempts")) {
        args.max_port_attempts = *val;
    }
    if (auto val = program.present<std::vector<std::string>>("--project")) {
        args.project_paths = *val;
    }
    args.debug = program.get<bool>("--debug");
    args.log_json = program.get<bool>("--log-json");
    if (program.get<bool>("-vv")) {
        args.verbosity = 2;
    } else if (program.get<bool>("-v")) {
        args.verbosity = 1;
    }
    args.force_color = program.get<bool>("--color");
    args.force_no_color = program.get<bool>("--no-color");

    return Result<BridgeCliArgs, Error>::Ok(std::move(args));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
BridgeConfig MergeConfigs(const BridgeConfig& yaml_base, const BridgeCliArgs& cli) {
    BridgeConfig merged = yaml_base;

    if (cli.host) {
        merged.host = *cli.host;
    }
    if (cli.port) {
        merged.port = *cli.port;
    }
    if (cli.max_port_attempts) {
        merged.max_port_attempts = *cli.max_port_attempts;
    }
    // CLI project roots replace the YAML list if present
    if (!cli.project_paths.empty()) {
        merged.project_paths = cli.project_paths;
    }
    if (cli.debug) {
        merged.debug_mode = true;
    }
    if (cli.log_json) {
        merged.log_json = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const BridgeConfig& config) {
    if (config.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: host"));
    }
    if (config.port < 1 || config.port > 65535) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid port: " + std::to_string(config.port)));
    }
    if (config.max_port_attempts <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_port_attempts must be positive, got " +
                            std::to_string(config.max_port_attempts)));
    }
    return Result<void, Error>::Ok();
}

LogLevel ResolveLogLevel(const BridgeConfig& config, int verbosity) {
    if (config.debug_mode || verbosity >= 2) return LogLevel::Debug;
    if (verbosity == 1) return LogLevel::Info;
    return LogLevel::Warn;
}

// ---------------------------------------------------------------------------
// LoadRelayConfigFromEnv
// ---------------------------------------------------------------------------
Result<RelayConfig, Error> LoadRelayConfigFromEnv(const EnvLookup& env) {
    const auto lookup = env ? env : EnvLookup(GetEnv);

    RelayConfig config;
    if (auto host = lookup("PULSAR_BRIDGE_HOST"); host && !host->empty()) {
        config.bridge_host = *host;
    }
    if (auto port = lookup("PULSAR_BRIDGE_PORT"); port && !port->empty()) {
        int value = 0;
        std::size_t consumed = 0;
        try {
            value = std::stoi(*port, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed != port->size() || value < 1 || value > 65535) {
            return Result<RelayConfig, Error>::Err(
                MakeConfigError("Invalid PULSAR_BRIDGE_PORT: " + *port));
        }
        config.bridge_port = static_cast<uint16_t>(value);
    }
    return Result<RelayConfig, Error>::Ok(std::move(config));
}

} // namespace pulsar_mcp
