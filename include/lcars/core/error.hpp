#pragma once

#include <string>
#include <utility>
#include <optional>

namespace lcars::core {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_INPUT,
    NOT_FOUND,
    INVALID_TRANSITION,
    TRANSIENT_NETWORK,
    FATAL_STORAGE,
    TUNNEL_SETUP,
    PERMISSION_DENIED
};

const char* error_code_to_string(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }

    std::string to_string() const;
};

// Result carrying a value on success
template<typename T>
struct ValueResult {
    Result status;
    std::optional<T> value;

    ValueResult(T v) : status(), value(std::move(v)) {}
    ValueResult(Result r) : status(std::move(r)) {}

    bool success() const { return status.success() && value.has_value(); }
    operator bool() const { return success(); }

    const T& operator*() const { return *value; }
    T& operator*() { return *value; }
    const T* operator->() const { return &*value; }
    T* operator->() { return &*value; }
};

} // namespace lcars::core
