#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// Result<T, E>: holds either a value or an error.
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

    [[nodiscard]] T& Value() & {
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

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    [[nodiscard]] T ValueOr(T default_value) && {
        if (IsOk()) {
            return std::get<0>(std::move(storage_));
        }
        return default_value;
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

    // fn: E -> E. Used to add context to an error on its way up.
    template <typename Fn>
    Result MapErr(Fn&& fn) && {
        if (IsErr()) {
            return Result::Err(std::forward<Fn>(fn)(std::get<1>(std::move(storage_))));
        }
        return std::move(*this);
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

// ---------------------------------------------------------------------------
// Result<void, E>: operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: the client's error taxonomy. Transport failures are
// classified into one of these once, at the transport edge.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Transaction,     // caller misuse or protocol violation
    Aborted,         // optimistic-concurrency conflict
    Retriable,       // transient server condition
    Connection,
    SessionExpired,
    Authentication,
    Cancelled,
    Timeout,
    Server,          // server rejected the request
    Config,
    Internal,
};

// Canonical messages shared by the transaction and retry layers.
inline constexpr const char* kAbortedMessage =
    "Transaction has been aborted. Please retry";
inline constexpr const char* kFinishedMessage =
    "Transaction has already been committed or discarded";
inline constexpr const char* kCancelledMessage = "Operation cancelled";

// ---------------------------------------------------------------------------
// Error: structured error carried through every layer.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> server_code;  // e.g. "ErrorInvalidRequest"
    ErrorCategory category = ErrorCategory::Internal;

    /// Build an error from a non-2xx HTTP status. The body is inspected for
    /// a Dgraph error message; classification follows ClassifyServerError.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    // -- Taxonomy shorthands --------------------------------------------------

    static Error Transaction(const std::string& operation, const std::string& message) {
        return Error{operation, "", std::nullopt, message, std::nullopt,
                     ErrorCategory::Transaction};
    }

    static Error Aborted(const std::string& operation) {
        return Error{operation, "", std::nullopt, kAbortedMessage, std::nullopt,
                     ErrorCategory::Aborted};
    }

    static Error Cancelled(const std::string& operation) {
        return Error{operation, "", std::nullopt, kCancelledMessage, std::nullopt,
                     ErrorCategory::Cancelled};
    }

    [[nodiscard]] bool IsConflict() const noexcept {
        return category == ErrorCategory::Aborted ||
               category == ErrorCategory::Retriable;
    }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Connection:     return 1;
            case ErrorCategory::SessionExpired: return 2;
            case ErrorCategory::Authentication: return 2;
            case ErrorCategory::Transaction:    return 3;
            case ErrorCategory::Aborted:        return 4;
            case ErrorCategory::Retriable:      return 5;
            case ErrorCategory::Cancelled:      return 6;
            case ErrorCategory::Server:         return 7;
            case ErrorCategory::Config:         return 8;
            case ErrorCategory::Timeout:        return 10;
            case ErrorCategory::Internal:       return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Transaction:    return "transaction";
            case ErrorCategory::Aborted:        return "aborted";
            case ErrorCategory::Retriable:      return "retriable";
            case ErrorCategory::Connection:     return "connection";
            case ErrorCategory::SessionExpired: return "session_expired";
            case ErrorCategory::Authentication: return "authentication";
            case ErrorCategory::Cancelled:      return "cancelled";
            case ErrorCategory::Timeout:        return "timeout";
            case ErrorCategory::Server:         return "server";
            case ErrorCategory::Config:         return "config";
            case ErrorCategory::Internal:       return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!endpoint.empty()) {
            oss << " [" << endpoint << "]";
        }
        if (http_status.has_value()) {
            oss << " (HTTP " << *http_status << ")";
        }
        oss << ": " << message;
        if (server_code.has_value() && !server_code->empty()) {
            oss << " (" << *server_code << ")";
        }
        return oss.str();
    }

    /// JSON rendering for --json output. Defined in result.cpp.
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               server_code == other.server_code &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

/// Classify a server-reported failure by its message and HTTP status.
/// This is the single place error text is inspected.
[[nodiscard]] ErrorCategory ClassifyServerError(const std::string& message,
                                                std::optional<int> http_status);

} // namespace dgraph_client
