#pragma once

#include <optional>
#include <string>
#include <utility>

#include "ErrorCodes.h"
#include "Exceptions.h"

namespace GlobalSend {

/**
 * @brief What went wrong, where, and which ErrorCode it maps to.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::INTERNAL_ERROR};
    std::string component;

    Error() = default;
    Error(std::string msg, ErrorCode c = ErrorCode::INTERNAL_ERROR, std::string comp = "")
        : message(std::move(msg)), code(c), component(std::move(comp)) {}

    /// "[Component] message (Code name)"
    std::string toString() const {
        std::string text = component.empty() ? message : "[" + component + "] " + message;
        return text + " (" + errorCodeToString(code) + ")";
    }

    [[noreturn]] void raise() const {
        throw GlobalSendError(code, toString());
    }
};

/**
 * @brief Value or Error, for lookups and option parsing where failure is
 *        an ordinary answer.
 *
 * The engine turns an Error into a GlobalSendError with valueOrThrow()
 * once it has decided the failure is fatal:
 *
 *   auto job = store.load(jobId);
 *   if (job.isError()) {
 *       LOG_WARN_COMP("JobStore", job.error().toString());
 *   }
 *   const ChunkerParams params = ChunkerParams::fromConfig(cfg).valueOrThrow();
 */
template<typename T>
class Result {
public:
    Result(const T& value) : value_(value) {}
    Result(T&& value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    bool isOk() const { return value_.has_value(); }
    bool isError() const { return !value_.has_value(); }
    explicit operator bool() const { return isOk(); }

    T& value() {
        if (!value_) error_.raise();
        return *value_;
    }

    const T& value() const {
        if (!value_) error_.raise();
        return *value_;
    }

    /// Moves the value out, or throws GlobalSendError with the stored code.
    T valueOrThrow() {
        if (!value_) error_.raise();
        return std::move(*value_);
    }

    const Error& error() const {
        if (value_) {
            throw GlobalSendError(ErrorCode::INTERNAL_ERROR, "error() called on a successful Result");
        }
        return error_;
    }

private:
    std::optional<T> value_;
    Error error_;
};

/**
 * @brief Success-or-Error for mutations with nothing to return.
 */
class VoidResult {
public:
    VoidResult() = default;
    VoidResult(Error error) : error_(std::move(error)) {}

    bool isOk() const { return !error_.has_value(); }
    bool isError() const { return error_.has_value(); }
    explicit operator bool() const { return isOk(); }

    void orThrow() const {
        if (error_) error_->raise();
    }

    const Error& error() const {
        if (!error_) {
            throw GlobalSendError(ErrorCode::INTERNAL_ERROR, "error() called on a successful VoidResult");
        }
        return *error_;
    }

private:
    std::optional<Error> error_;
};

inline VoidResult Ok() {
    return VoidResult();
}

} // namespace GlobalSend
