#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace HN {

struct Error {
    enum class Code {
        UnknownError = 0,
        FetchTimeout,
        FetchTransportError,
        EvalError,
        MergeConflict,
        UnknownQueryReference,
        UnknownActionReference,
        UnknownComponentReference,
        InvalidConfiguration,
        MalformedInput,
        InvalidState,
        Cancelled
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::FetchTimeout:
        return "fetch_timeout";
    case Error::Code::FetchTransportError:
        return "fetch_transport_error";
    case Error::Code::EvalError:
        return "eval_error";
    case Error::Code::MergeConflict:
        return "merge_conflict";
    case Error::Code::UnknownQueryReference:
        return "unknown_query_reference";
    case Error::Code::UnknownActionReference:
        return "unknown_action_reference";
    case Error::Code::UnknownComponentReference:
        return "unknown_component_reference";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidState:
        return "invalid_state";
    case Error::Code::Cancelled:
        return "cancelled";
    }
    return "unknown_error";
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

} // namespace HN
