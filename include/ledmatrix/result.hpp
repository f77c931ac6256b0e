#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace ledmatrix {

//=============================================================================
// Error - message plus the chain of errors that caused it
//=============================================================================

class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    // "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (const Error* e = cause(); e; e = e->cause()) {
            out += ": ";
            out += e->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::in_place, std::forward<T>(value));
}

// Untyped error, converts to any Result<T>
inline std::unexpected<Error> Err(std::string message) {
    return std::unexpected<Error>(Error(std::move(message)));
}

template<typename T>
Result<T> Err(std::string message) {
    return std::unexpected<Error>(Error(std::move(message)));
}

// Wrap the error of a failed result with more context
template<typename T, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    if (cause) {
        return std::unexpected<Error>(Error(std::move(message)));
    }
    return std::unexpected<Error>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace ledmatrix
