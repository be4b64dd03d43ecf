#pragma once

/// @file expected.h
/// @brief expected<T, E> type for error handling without exceptions
///
/// Modeled after C++23's std::expected, reduced to what the engine needs.
///
/// @code
/// expected<int> divide(int a, int b) {
///     if (b == 0) {
///         return expected<int>::failure(ResultError::INVALID_ARGUMENT,
///                                       "Division by zero");
///     }
///     return expected<int>::success(a / b);
/// }
/// @endcode

#include <string>
#include <utility>

#include "ht/int.h"

namespace ht {

/// @brief Generic error codes when no domain specific enum is needed
enum class ResultError : u8 {
    OK,               ///< No error (not typically used)
    UNKNOWN,          ///< Unknown or unspecified error
    INVALID_ARGUMENT, ///< Invalid argument provided
    OUT_OF_RANGE,     ///< Value out of valid range
};

/// @brief Error information carried by a failed expected
template <typename E> struct ErrorInfo {
    E code;
    std::string message;

    ErrorInfo() : code(E{}) {}
    ErrorInfo(E err, const char *msg) : code(err), message(msg ? msg : "") {}
    ErrorInfo(E err, std::string msg) : code(err), message(std::move(msg)) {}
};

template <typename T, typename E = ResultError> class expected {
  public:
    /// @brief Check if operation succeeded
    bool ok() const { return mOk; }

    /// @brief Get error code (only meaningful if !ok())
    E error() const { return mError.code; }

    /// @brief Get error message (only meaningful if !ok())
    const char *message() const { return mError.message.c_str(); }

    /// @brief Get value (only meaningful if ok())
    T &value() { return mValue; }
    const T &value() const { return mValue; }

    explicit operator bool() const { return ok(); }

    static expected success(T value) {
        expected r;
        r.mValue = std::move(value);
        r.mOk = true;
        return r;
    }

    static expected failure(E err, const char *msg = nullptr) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    static expected failure(E err, std::string msg) {
        expected r;
        r.mError = ErrorInfo<E>(err, std::move(msg));
        return r;
    }

    /// @brief Carries the error of another expected over to this value type
    template <typename U>
    static expected failure(const expected<U, E> &other) {
        return failure(other.error(), std::string(other.message()));
    }

    /// @brief Default constructor (creates error state)
    expected() = default;

    expected(expected &&other) noexcept = default;
    expected &operator=(expected &&other) noexcept = default;
    ~expected() = default;

  private:
    expected(const expected &) = delete;
    expected &operator=(const expected &) = delete;

    T mValue{};
    ErrorInfo<E> mError;
    bool mOk = false;
};

/// @brief Specialization for operations with no value to return
template <typename E> class expected<void, E> {
  public:
    bool ok() const { return mOk; }

    E error() const { return mError.code; }

    const char *message() const { return mError.message.c_str(); }

    explicit operator bool() const { return ok(); }

    static expected success() {
        expected r;
        r.mOk = true;
        return r;
    }

    static expected failure(E err, const char *msg = nullptr) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    static expected failure(E err, std::string msg) {
        expected r;
        r.mError = ErrorInfo<E>(err, std::move(msg));
        return r;
    }

    template <typename U>
    static expected failure(const expected<U, E> &other) {
        return failure(other.error(), std::string(other.message()));
    }

    expected() = default;
    expected(const expected &other) = default;
    expected &operator=(const expected &other) = default;
    expected(expected &&other) noexcept = default;
    expected &operator=(expected &&other) noexcept = default;

  private:
    ErrorInfo<E> mError;
    bool mOk = false;
};

} // namespace ht
