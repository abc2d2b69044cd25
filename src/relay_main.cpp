#include <pulsar_mcp/config/config_loader.hpp>
#include <pulsar_mcp/core/log.hpp>
#include <pulsar_mcp/core/terminal.hpp>
#include <pulsar_mcp/core/version.hpp>
#include <pulsar_mcp/relay/bridge_client.hpp>
#include <pulsar_mcp/relay/stdio_relay.hpp>

#include <iostream>
#include <memory>
#include <string_view>

namespace {

constexpr int kExitUsage = 5;

void PrintUsage(std::ostream& out) {
    out << "Usage: pulsar-mcp [-v|-vv] [--color|--no-color]\n"
           "\n"
           "MCP server on stdin/stdout that forwards tool calls to the\n"
           "pulsar-mcp HTTP bridge.\n"
           "\n"
           "Environment:\n"
           "  PULSAR_BRIDGE_HOST  bridge host (default: 127.0.0.1)\n"
           "  PULSAR_BRIDGE_PORT  bridge port (default: 3000)\n";
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace pulsar_mcp;

    // Parse verbosity and color flags. stdout is reserved for JSON-RPC.
    auto log_level = LogLevel::Warn;
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cerr << "pulsar-mcp " << kVersion << "\n";
            return 0;
        }
        if (arg == "--help" || arg == "-h") {
            PrintUsage(std::cerr);
            return 0;
        }
        if (arg == "-vv") { log_level = LogLevel::Debug; }
        else if (arg == "-v")  { log_level = LogLevel::Info; }
        else if (arg == "--color") { force_color = true; }
        else if (arg == "--no-color") { force_no_color = true; }
        else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(std::cerr);
            return kExitUsage;
        }
    }
    InitGlobalLogger(std::make_unique<ConsoleSink>(
                         ResolveLogColor(force_color, force_no_color)),
                     log_level);

    auto config = LoadRelayConfigFromEnv();
    if (config.IsErr()) {
        std::cerr << "Error: " << config.Error().ToString() << "\n";
        return config.Error().ExitCode();
    }

    HttpBridgeClient client(config.Value().bridge_host, config.Value().bridge_port);
    StdioRelay relay(client, std::cin, std::cout);
    return relay.Run();
}
