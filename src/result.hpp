// =============================================================================
// FleetDeck - Result Type for Unified Error Handling
// =============================================================================
// Either a success value or an error. Used where a failure has a reason the
// caller reports (config and catalog loading, transport open, socket connect,
// statistics sampling). Command sends never return one: they are
// fire-and-forget.
//
// Usage:
//   Result<PixelSize> lookup(const DeviceId& id) {
//       if (!known(id)) return Err<PixelSize>("unknown device " + id);
//       return Ok(sizeOf(id));
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace fleetdeck {

// =============================================================================
// Error Types
// =============================================================================

// Generic error with message
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// Transport failure (primary channel or signaling socket)
struct TransportError : Error {
    enum class Kind {
        NotConnected,
        ConnectFailed,
        Timeout,
        Closed,
        Protocol,
        Other
    };
    Kind kind = Kind::Other;

    TransportError() = default;
    explicit TransportError(std::string msg, Kind k = Kind::Other)
        : Error(std::move(msg), static_cast<int>(k)), kind(k) {}
};

inline const char* transportErrorKindStr(TransportError::Kind k) {
    switch (k) {
        case TransportError::Kind::NotConnected:  return "not-connected";
        case TransportError::Kind::ConnectFailed: return "connect-failed";
        case TransportError::Kind::Timeout:       return "timeout";
        case TransportError::Kind::Closed:        return "closed";
        case TransportError::Kind::Protocol:      return "protocol";
        case TransportError::Kind::Other:         return "other";
    }
    return "?";
}

// =============================================================================
// Result<T, E>
// =============================================================================
// Accessing the wrong side throws std::runtime_error: that is a programming
// error, callers check is_ok() first.

namespace detail {

[[noreturn]] inline void throwNotOk(const Error& e) {
    throw std::runtime_error("Result is error: " + e.message);
}

[[noreturn]] inline void throwNotErr() {
    throw std::runtime_error("Result is ok, no error");
}

} // namespace detail

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return !is_ok(); }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<0>(checked()); }
    const T& value() const& { return std::get<0>(checked()); }
    T&& value() && { return std::get<0>(std::move(checked())); }

    E& error() & {
        if (is_ok()) detail::throwNotErr();
        return std::get<1>(data_);
    }
    const E& error() const& {
        if (is_ok()) detail::throwNotErr();
        return std::get<1>(data_);
    }

    T value_or(T fallback) const& { return is_ok() ? std::get<0>(data_) : std::move(fallback); }

private:
    std::variant<T, E>& checked() {
        if (!is_ok()) detail::throwNotOk(std::get<1>(data_));
        return data_;
    }
    const std::variant<T, E>& checked() const {
        if (!is_ok()) detail::throwNotOk(std::get<1>(data_));
        return data_;
    }

    std::variant<T, E> data_;
};

// Success carries nothing; the error is optional
template<typename E>
class Result<void, E> {
public:
    Result() = default;

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : error_(E(std::move(error))) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (error_) detail::throwNotOk(*error_);
    }

    E& error() & {
        if (!error_) detail::throwNotErr();
        return *error_;
    }
    const E& error() const& {
        if (!error_) detail::throwNotErr();
        return *error_;
    }

private:
    std::optional<E> error_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return {};
}

// Err<T>("reason") for the generic Error; typed errors convert implicitly
template<typename T>
Result<T, Error> Err(std::string message, int code = 0) {
    return Error(std::move(message), code);
}

template<typename T>
Result<T, Error> Err(const char* message, int code = 0) {
    return Error(message, code);
}

} // namespace fleetdeck
