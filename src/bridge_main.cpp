#include <pulsar_mcp/bridge/bridge_service.hpp>
#include <pulsar_mcp/config/config_loader.hpp>
#include <pulsar_mcp/core/log.hpp>
#include <pulsar_mcp/core/terminal.hpp>
#include <pulsar_mcp/editor/editor_tools.hpp>
#include <pulsar_mcp/editor/workspace.hpp>
#include <pulsar_mcp/mcp/tool_registry.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;

std::atomic<bool> g_shutdown{false};
std::atomic<bool> g_toggle{false};

extern "C" void OnShutdownSignal(int) { g_shutdown = true; }
extern "C" void OnToggleSignal(int) { g_toggle = true; }

void InstallSignalHandlers() {
    std::signal(SIGINT, OnShutdownSignal);
    std::signal(SIGTERM, OnShutdownSignal);
#ifdef SIGUSR1
    std::signal(SIGUSR1, OnToggleSignal);
#endif
}

void PrintError(const pulsar_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace pulsar_mcp;

    // Step 1: parse CLI (handles --help/--version internally via argparse).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    const auto cli = std::move(cli_result).Value();

    // Step 2: load YAML if -c/--config was given, then merge and validate.
    BridgeConfig config;
    if (cli.config_file) {
        auto yaml_result = LoadFromYaml(*cli.config_file);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = std::move(yaml_result).Value();
    }
    config = MergeConfigs(config, cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Step 3: logging.
    const auto log_level = ResolveLogLevel(config, cli.verbosity);
    if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(), log_level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(
                             ResolveLogColor(cli.force_color, cli.force_no_color)),
                         log_level);
    }

    // Step 4: editor host and built-in tools.
    Workspace workspace;
    for (const auto& path : config.project_paths) {
        if (!workspace.AddProjectPath(path)) {
            LogWarn("main", "Ignoring project path that is not a directory: " + path);
        }
    }
    ToolRegistry registry;
    RegisterEditorTools(registry, workspace);

    // Step 5: bridge service.
    BridgeOptions options;
    options.host = config.host;
    options.port = static_cast<uint16_t>(config.port);
    options.max_port_attempts = config.max_port_attempts;
    BridgeService service(options, registry);

    InstallSignalHandlers();

    if (config.auto_start) {
        auto started = service.Start();
        if (started.IsErr()) {
            PrintError(started.Error());
            return started.Error().ExitCode();
        }
        std::cout << service.Status() << std::endl;
    } else {
        LogInfo("main", "Waiting for SIGUSR1 to start the MCP bridge");
    }

    // Step 6: run until SIGINT/SIGTERM; SIGUSR1 toggles the bridge.
    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (!g_toggle.exchange(false)) {
            continue;
        }
        auto toggled = service.IsRunning() ? service.Stop() : service.Start();
        if (toggled.IsErr()) {
            LogError("main", toggled.Error().ToString());
        }
        std::cout << service.Status() << std::endl;
    }

    if (service.IsRunning()) {
        auto stopped = service.Stop();
        if (stopped.IsErr()) {
            PrintError(stopped.Error());
            return stopped.Error().ExitCode();
        }
    }
    return kExitSuccess;
}
