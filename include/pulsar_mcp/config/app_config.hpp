#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pulsar_mcp {

inline constexpr const char* kDefaultBridgeHost = "127.0.0.1";
inline constexpr int kDefaultBridgePort = 3000;

// Settings of the pulsar-mcp-bridge executable (YAML file + CLI).
struct BridgeConfig {
    std::string host = kDefaultBridgeHost;
    int port = kDefaultBridgePort;  // first port probed
    int max_port_attempts = 100;
    bool auto_start = true;         // false: wait for SIGUSR1
    bool debug_mode = false;
    bool log_json = false;
    std::vector<std::string> project_paths;
};

// Flags of the pulsar-mcp-bridge command line. Unset values leave the YAML
// value alone.
struct BridgeCliArgs {
    std::optional<std::string> config_file;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<int> max_port_attempts;
    std::vector<std::string> project_paths;
    bool debug = false;
    bool log_json = false;
    int verbosity = 0;  // 1 for -v, 2 for -vv
    bool force_color = false;
    bool force_no_color = false;
};

// Settings of the pulsar-mcp stdio relay (environment only).
struct RelayConfig {
    std::string bridge_host = kDefaultBridgeHost;
    uint16_t bridge_port = static_cast<uint16_t>(kDefaultBridgePort);
};

} // namespace pulsar_mcp
