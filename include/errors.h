#pragma once

#include <string>
#include <variant>
#include <stdexcept>

namespace domo_nlu {

/**
 * @brief Failure categories surfaced by the loaders, the fallback and the worker pool
 *
 * The rule stages never fail; only the edges of the pipeline do:
 *   IOError / ParseError  - device snapshot and config files
 *   VocabularyError       - a snapshot rejected by the resolver
 *   NetworkError / Timeout / ParseError - the fallback interpreter
 *   Cancelled             - a request whose cancel token was raised
 *   Internal              - anything else (fallback threw, pool shut down)
 */
enum class ErrorType {
    None,
    IOError,
    NetworkError,
    ParseError,
    VocabularyError,
    Timeout,
    Cancelled,
    Internal
};

struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
};

/**
 * @brief Either a value of type T or an Error
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }

    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("value() on failed Result: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("value() on failed Result: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("error() on successful Result");
        }
        return std::get<Error>(data_);
    }

    explicit operator bool() const { return is_ok(); }

private:
    std::variant<T, Error> data_;
};

// Success/failure only (vocabulary reloads)
template<>
class Result<void> {
public:
    Result() : ok_(true) {}
    Result(const Error& error) : ok_(false), error_(error) {}
    Result(Error&& error) : ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return ok_; }
    bool is_error() const { return !ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return ok_; }

private:
    bool ok_;
    Error error_;
};

/// Snake-case name used in JSON output ("network_error", "timeout", ...)
const char* to_string(ErrorType type);

/// "<type>: <message>", the form used in degraded notes
inline std::string describe(const Error& error) {
    return std::string(to_string(error.type)) + ": " + error.message;
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_vocabulary_error(const std::string& message) {
    return Error(ErrorType::VocabularyError, message);
}

inline Error make_timeout_error(const std::string& message = "fallback timed out") {
    return Error(ErrorType::Timeout, message);
}

inline Error make_cancelled_error(const std::string& message = "request cancelled") {
    return Error(ErrorType::Cancelled, message);
}

inline Error make_internal_error(const std::string& message) {
    return Error(ErrorType::Internal, message);
}

} // namespace domo_nlu
