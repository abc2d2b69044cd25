#include <pulsar_mcp/bridge/port_allocator.hpp>

#include <pulsar_mcp/core/log.hpp>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace pulsar_mcp {

namespace {

#ifdef _WIN32
using socket_t = SOCKET;
constexpr socket_t kInvalidSocket = INVALID_SOCKET;
void CloseSocket(socket_t s) { closesocket(s); }
#else
using socket_t = int;
constexpr socket_t kInvalidSocket = -1;
void CloseSocket(socket_t s) { close(s); }
#endif

// RAII owner for the probe socket.
class ProbeSocket {
public:
    explicit ProbeSocket(socket_t s) : sock_(s) {}
    ~ProbeSocket() {
        if (sock_ != kInvalidSocket) {
            CloseSocket(sock_);
        }
    }
    ProbeSocket(const ProbeSocket&) = delete;
    ProbeSocket& operator=(const ProbeSocket&) = delete;

    [[nodiscard]] socket_t Get() const noexcept { return sock_; }
    [[nodiscard]] bool Valid() const noexcept { return sock_ != kInvalidSocket; }

private:
    socket_t sock_;
};

} // anonymous namespace

bool IsPortAvailable(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* result = nullptr;
    const auto service = std::to_string(port);
    if (getaddrinfo(host.c_str(), service.c_str(), &hints, &result) != 0) {
        return false;
    }

    bool available = false;
    for (auto* rp = result; rp != nullptr; rp = rp->ai_next) {
        ProbeSocket sock(socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol));
        if (!sock.Valid()) {
            continue;
        }
        if (bind(sock.Get(), rp->ai_addr, static_cast<int>(rp->ai_addrlen)) == 0 &&
            listen(sock.Get(), 1) == 0) {
            available = true;
            break;
        }
    }
    freeaddrinfo(result);
    return available;
}

Result<uint16_t, Error> FindAvailablePort(uint16_t start,
                                          const std::string& host,
                                          int max_attempts) {
    int attempts_made = 0;
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        const int candidate = static_cast<int>(start) + attempt;
        if (candidate > 65535) {
            break;
        }
        ++attempts_made;
        const auto port = static_cast<uint16_t>(candidate);
        if (IsPortAvailable(host, port)) {
            if (attempt > 0) {
                LogDebug("bridge", "Port " + std::to_string(start) +
                                   " in use, using " + std::to_string(port));
            }
            return Result<uint16_t, Error>::Ok(port);
        }
        LogDebug("bridge", "Port " + std::to_string(port) + " unavailable");
    }

    return Result<uint16_t, Error>::Err(Error{
        "FindAvailablePort", host, std::nullopt,
        "Could not find available port after " + std::to_string(attempts_made) +
            " attempts starting from " + std::to_string(start),
        ErrorCategory::PortExhausted});
}

} // namespace pulsar_mcp
