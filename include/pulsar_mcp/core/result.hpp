#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pulsar_mcp {

// ---------------------------------------------------------------------------
// Result<T, E> — either a value or an error, never both.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(fallback);
    }

    // fn: const T& -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using Next = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return Next::Err(std::get<1>(storage_));
    }

    // fn: const T& -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// Result<void, E> — success carries no value.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(const E& error) { return Result(std::optional<E>(error)); }
    static Result Err(E&& error) { return Result(std::optional<E>(std::move(error))); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — what kind of failure, drives exit codes.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Connection,     // bridge unreachable, socket failure
    NotFound,       // HTTP 404 from the bridge
    Protocol,       // unexpected or unparseable payload
    PortExhausted,  // no free port within the probe window
    Bind,           // listener could not bind after a successful probe
    Config,         // invalid configuration or environment
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error for bridge, relay and config operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    /// Build an Error from a bridge HTTP response. If the body is a JSON
    /// object with an "error" string, that string becomes the message.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Connection:    return 1;
            case ErrorCategory::NotFound:      return 2;
            case ErrorCategory::Protocol:      return 3;
            case ErrorCategory::PortExhausted: return 4;
            case ErrorCategory::Bind:          return 4;
            case ErrorCategory::Config:        return 5;
            case ErrorCategory::Internal:      return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Connection:    return "connection";
            case ErrorCategory::NotFound:      return "not_found";
            case ErrorCategory::Protocol:      return "protocol";
            case ErrorCategory::PortExhausted: return "port_exhausted";
            case ErrorCategory::Bind:          return "bind";
            case ErrorCategory::Config:        return "config";
            case ErrorCategory::Internal:      return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::string out = operation;
        if (!endpoint.empty()) {
            out += " [" + endpoint + "]";
        }
        if (http_status.has_value()) {
            out += " (HTTP " + std::to_string(*http_status) + ")";
        }
        out += ": " + message;
        return out;
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               category == other.category;
    }

    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace pulsar_mcp
