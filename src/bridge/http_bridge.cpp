#include <pulsar_mcp/bridge/http_bridge.hpp>

#include <pulsar_mcp/bridge/port_allocator.hpp>
#include <pulsar_mcp/core/log.hpp>
#include <pulsar_mcp/mcp/mcp_server.hpp>
#include <pulsar_mcp/mcp/session_store.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <thread>

namespace pulsar_mcp {

namespace {

constexpr const char* kJsonContentType = "application/json";

void SetJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false,
                              nlohmann::json::error_handler_t::replace),
                    kJsonContentType);
}

void SetJsonError(httplib::Response& res, int status, const std::string& message) {
    SetJson(res, status, {{"error", message}});
}

std::optional<std::string> SessionHeader(const httplib::Request& req) {
    if (!req.has_header(kSessionHeader)) {
        return std::nullopt;
    }
    auto value = req.get_header_value(kSessionHeader);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — owns the listener, its thread and the per-bridge session store.
// ---------------------------------------------------------------------------
struct BridgeHandle::Impl {
    std::string host;
    uint16_t port = 0;
    const ToolRegistry& builtins;
    const ExternalToolMap& externals;
    SessionStore sessions;
    McpServer mcp;
    httplib::Server server;
    std::thread listener;
    std::atomic<bool> running{false};

    Impl(std::string host_value, const ToolRegistry& builtins_ref,
         const ExternalToolMap& externals_ref)
        : host(std::move(host_value)),
          builtins(builtins_ref),
          externals(externals_ref),
          mcp(builtins_ref, externals_ref, sessions) {
        InstallRoutes();
    }

    void InstallRoutes() {
        server.set_default_headers({{"Access-Control-Allow-Origin", "*"}});

        server.set_logger([](const httplib::Request& req,
                             const httplib::Response& res) {
            LogDebug("bridge", req.method + " " + req.path + " -> " +
                               std::to_string(res.status));
        });

        server.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
            res.set_header("Access-Control-Allow-Headers",
                           "Content-Type, Mcp-Session-Id, Accept");
            res.set_header("Access-Control-Expose-Headers", "Mcp-Session-Id");
            res.status = 204;
        });

        server.Post("/mcp", [this](const httplib::Request& req,
                                   httplib::Response& res) {
            Guarded(res, [&] { HandleMcpPost(req, res); });
        });

        server.Delete("/mcp", [this](const httplib::Request& req,
                                     httplib::Response& res) {
            Guarded(res, [&] {
                if (auto id = SessionHeader(req)) {
                    if (sessions.Erase(*id)) {
                        LogDebug("bridge", "MCP session terminated: " + *id);
                    }
                }
                res.status = 204;
            });
        });

        server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            SetJson(res, 200, {{"status", "ok"}, {"timestamp", EpochMillisNow()}});
        });

        server.Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
            Guarded(res, [&] { SetJson(res, 200, {{"tools", mcp.ListTools()}}); });
        });

        server.Post(R"(/tools/([A-Z][a-zA-Z]*))", [this](const httplib::Request& req,
                                                       httplib::Response& res) {
            Guarded(res, [&] { HandleToolPost(req, res); });
        });

        server.set_error_handler([](const httplib::Request& req,
                                    httplib::Response& res) {
            if (res.status == 404 && res.body.empty()) {
                LogDebug("bridge", "No route for " + req.method + " " + req.path);
                SetJsonError(res, 404, "Not found");
            }
        });
    }

    // Any exception escaping a route becomes a 500 with its message.
    template <typename Fn>
    static void Guarded(httplib::Response& res, Fn&& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            LogError("bridge", std::string("Request failed: ") + e.what());
            SetJsonError(res, 500, e.what());
        }
    }

    void HandleMcpPost(const httplib::Request& req, httplib::Response& res) {
        auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded()) {
            SetJson(res, 400, rpc::MakeError(nullptr, rpc::kParseError,
                                             "Parse error: invalid JSON"));
            return;
        }

        auto reply = mcp.HandleBody(body, SessionHeader(req));
        if (reply.session_id) {
            res.set_header(kSessionHeader, *reply.session_id);
        }
        if (!reply.response) {
            res.status = 202;
            return;
        }
        SetJson(res, 200, *reply.response);
    }

    void HandleToolPost(const httplib::Request& req, httplib::Response& res) {
        const auto name = req.matches[1].str();

        nlohmann::json args = nlohmann::json::object();
        if (!req.body.empty()) {
            args = nlohmann::json::parse(req.body, nullptr, false);
            if (args.is_discarded()) {
                SetJsonError(res, 500, "Invalid JSON body");
                return;
            }
        }

        auto result = mcp.Executor().Execute(name, args);
        SetJson(res, result.success ? 200 : 400, result.ToJson());
    }

    void Shutdown() {
        server.stop();
        if (listener.joinable()) {
            listener.join();
        }
        running = false;
    }
};

BridgeHandle::BridgeHandle(Key, std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

BridgeHandle::~BridgeHandle() {
    if (impl_ && impl_->running) {
        impl_->Shutdown();
    }
}

uint16_t BridgeHandle::Port() const noexcept { return impl_->port; }

const std::string& BridgeHandle::Host() const noexcept { return impl_->host; }

std::string BridgeHandle::Url() const {
    return "http://" + impl_->host + ":" + std::to_string(impl_->port);
}

bool BridgeHandle::IsRunning() const noexcept { return impl_->running; }

Result<void, Error> BridgeHandle::Stop() {
    if (!impl_->running) {
        return Result<void, Error>::Err(Error{
            "StopBridge", Url(), std::nullopt, "Bridge is not running",
            ErrorCategory::Internal});
    }
    impl_->Shutdown();
    LogInfo("bridge", "MCP bridge stopped");
    return Result<void, Error>::Ok();
}

Result<std::unique_ptr<BridgeHandle>, Error> StartBridge(
    const BridgeOptions& options,
    const ToolRegistry& builtins,
    const ExternalToolMap& externals) {
    using R = Result<std::unique_ptr<BridgeHandle>, Error>;

    return FindAvailablePort(options.port, options.host, options.max_port_attempts)
        .AndThen([&](uint16_t port) -> R {
            auto impl = std::make_unique<BridgeHandle::Impl>(options.host, builtins,
                                                             externals);
            impl->port = port;

            if (!impl->server.bind_to_port(impl->host, impl->port)) {
                return R::Err(Error{
                    "StartBridge",
                    "http://" + impl->host + ":" + std::to_string(impl->port),
                    std::nullopt, "Failed to bind listener", ErrorCategory::Bind});
            }

            auto* server = &impl->server;
            impl->listener = std::thread([server] { server->listen_after_bind(); });
            impl->server.wait_until_ready();
            impl->running = true;

            auto handle = std::make_unique<BridgeHandle>(BridgeHandle::Key{},
                                                         std::move(impl));
            LogInfo("bridge", "MCP bridge listening on " + handle->Url());
            return R::Ok(std::move(handle));
        });
}

} // namespace pulsar_mcp
