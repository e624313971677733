#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace OQ {

struct Error {
    enum class Code {
        UnknownError = 0,
        NotFound,
        BadRequest,
        UnsupportedParam,
        Access,
        TypeMismatch,
        Conflict,
        Validation,
        InvalidPath,
        Reentrancy,
        ShuttingDown,
        MalformedInput
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
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::BadRequest:
        return "bad_request";
    case Error::Code::UnsupportedParam:
        return "unsupported_param";
    case Error::Code::Access:
        return "access";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::Conflict:
        return "conflict";
    case Error::Code::Validation:
        return "validation";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::Reentrancy:
        return "reentrancy";
    case Error::Code::ShuttingDown:
        return "shutting_down";
    case Error::Code::MalformedInput:
        return "malformed_input";
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

} // namespace OQ
