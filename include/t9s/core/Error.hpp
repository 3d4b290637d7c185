#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace T9 {

struct Error {
    enum class Code {
        UnknownError = 0,
        ConnectionError,
        AuthError,
        NotFoundError,
        ValidationError,
        TimeoutError,
        ServerError,
        RoutingError,
        OperationNotFound,
        InvalidConfiguration,
        MalformedResponse,
        Unavailable
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;

    bool operator==(Error const&) const = default;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::ConnectionError:
        return "connection";
    case Error::Code::AuthError:
        return "auth";
    case Error::Code::NotFoundError:
        return "not_found";
    case Error::Code::ValidationError:
        return "validation";
    case Error::Code::TimeoutError:
        return "timeout";
    case Error::Code::ServerError:
        return "server";
    case Error::Code::RoutingError:
        return "routing";
    case Error::Code::OperationNotFound:
        return "operation_not_found";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    case Error::Code::MalformedResponse:
        return "malformed_response";
    case Error::Code::Unavailable:
        return "unavailable";
    }
    return "unknown_error";
}

// Connection, timeout and server failures drive the poll backoff; everything
// else is surfaced once and left alone.
[[nodiscard]] inline auto isRetryable(Error::Code code) -> bool {
    return code == Error::Code::ConnectionError
           || code == Error::Code::TimeoutError
           || code == Error::Code::ServerError;
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace T9
