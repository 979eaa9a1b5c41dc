#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace upl {

/**
 * @brief Error categories shared by every pipeline stage
 *
 * The kind decides what happens next:
 * - business/data kinds end the session in a terminal status, never retried
 * - transient kinds are retried by the job runner with backoff
 * - ScannerUnavailable degrades: the upload completes without a scan
 */
enum class ErrorKind {
    InvalidArgument,
    NotFound,
    Conflict,
    InvalidTransition,
    Assembly,
    FileNotFound,
    Infected,
    Cancelled,
    Storage,
    ScanTimeout,
    ScannerUnavailable,
    Internal
};

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::InvalidTransition: return "invalid_transition";
        case ErrorKind::Assembly: return "assembly";
        case ErrorKind::FileNotFound: return "file_not_found";
        case ErrorKind::Infected: return "infected";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::ScanTimeout: return "scan_timeout";
        case ErrorKind::ScannerUnavailable: return "scanner_unavailable";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

/// Infrastructure failures worth another attempt.
inline bool is_transient(ErrorKind kind) {
    return kind == ErrorKind::Storage ||
           kind == ErrorKind::ScanTimeout ||
           kind == ErrorKind::Internal;
}

inline bool is_retryable(const Error& error) {
    return is_transient(error.kind);
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<T> Err(Error error) { return Result<T>(ErrValue<Error>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error{kind, std::move(message)}));
}

} // namespace upl
