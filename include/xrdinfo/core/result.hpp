#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace xrdinfo {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access (const&) ----------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    // -- Access (&&) --------------------------------------------------------

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
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

    // -- Monadic: AndThen ---------------------------------------------------
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

    // -- Monadic: Map -------------------------------------------------------
    // fn: T -> U

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

// ---------------------------------------------------------------------------
// Result<void, E> — specialization for operations that succeed with no value.
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
// ErrorCategory — the failure kinds surfaced by the library.
//
//   Network            configuration source unreachable (all sources tried)
//   Timeout            a call exceeded its caller-supplied timeout
//   Connection         transport/TLS failure talking to a gateway
//   Format             unparseable or structurally invalid payload
//   Integrity          digest mismatch on a configuration part
//   Trust              signature, certificate or instance check failed
//   ProtocolFault      well-formed error answer from the remote side
//   AddressResolution  no gateway address registered for an identifier
//   InvalidArgument    caller supplied a malformed request
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Network,
    Timeout,
    Connection,
    Format,
    Integrity,
    Trust,
    ProtocolFault,
    AddressResolution,
    InvalidArgument,
    Internal,
};

// ---------------------------------------------------------------------------
// ProtocolFault — remote error as reported by the gateway, text untouched.
// ---------------------------------------------------------------------------
struct ProtocolFault {
    std::string fault_code;
    std::string fault_string;

    bool operator==(const ProtocolFault& other) const {
        return fault_code == other.fault_code && fault_string == other.fault_string;
    }
    bool operator!=(const ProtocolFault& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// Error — structured error type for all library operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    // Detail text supplied by the remote side, preserved verbatim.
    std::optional<std::string> remote_error;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<std::string> fault_code;

    /// Create an Error from a non-success HTTP status. Remote detail is taken
    /// from a SOAP faultstring, a JSON "message" member, or the raw body.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    /// Create a ProtocolFault error carrying the remote code and text.
    static Error Fault(const std::string& operation,
                       const std::string& endpoint,
                       std::optional<int> http_status,
                       const std::string& fault_code,
                       const std::string& fault_string);

    [[nodiscard]] bool IsProtocolFault() const noexcept {
        return category == ErrorCategory::ProtocolFault;
    }

    /// The fault as a value; nullopt unless category is ProtocolFault.
    [[nodiscard]] std::optional<ProtocolFault> AsProtocolFault() const;

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Network:           return 1;
            case ErrorCategory::Connection:        return 1;
            case ErrorCategory::Timeout:           return 2;
            case ErrorCategory::Format:            return 3;
            case ErrorCategory::Integrity:         return 4;
            case ErrorCategory::Trust:             return 5;
            case ErrorCategory::ProtocolFault:     return 6;
            case ErrorCategory::AddressResolution: return 7;
            case ErrorCategory::InvalidArgument:   return 8;
            case ErrorCategory::Internal:          return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Network:           return "network";
            case ErrorCategory::Timeout:           return "timeout";
            case ErrorCategory::Connection:        return "connection";
            case ErrorCategory::Format:            return "format";
            case ErrorCategory::Integrity:         return "integrity";
            case ErrorCategory::Trust:             return "trust";
            case ErrorCategory::ProtocolFault:     return "protocol_fault";
            case ErrorCategory::AddressResolution: return "address_resolution";
            case ErrorCategory::InvalidArgument:   return "invalid_argument";
            case ErrorCategory::Internal:          return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               remote_error == other.remote_error &&
               category == other.category &&
               fault_code == other.fault_code;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace xrdinfo
