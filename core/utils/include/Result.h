#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>
#include <cstring>

namespace LanScout {

namespace detail {
// strerror_r is the XSI int-returning form or the GNU char*-returning one
inline const char* strerrorText(int rc, const char* buffer) { return rc == 0 ? buffer : "Unknown error"; }
inline const char* strerrorText(const char* text, const char*) { return text; }
} // namespace detail

/// Thread-safe strerror()
inline std::string errnoMessage(int err) {
    char buffer[128] = {};
    return detail::strerrorText(::strerror_r(err, buffer, sizeof(buffer)), buffer);
}

/**
 * @brief Error type for Result pattern
 *
 * `code` carries errno for platform failures so callers can tell a policy
 * denial (EACCES/EPERM) apart from other socket errors.
 */
struct Error {
    std::string message;
    int code{0};
    std::string component;

    Error() = default;
    Error(std::string msg, int c = 0, std::string comp = "")
        : message(std::move(msg)), code(c), component(std::move(comp)) {}

    std::string toString() const {
        std::string result = message;
        if (!component.empty()) {
            result = "[" + component + "] " + result;
        }
        if (code != 0) {
            result += " (code: " + std::to_string(code) + ")";
        }
        return result;
    }
};

/**
 * @brief Result type for explicit error handling
 *
 * Usage:
 *   Result<std::vector<NetworkInterface>> snap = provider.snapshot();
 *   if (!snap) {
 *       logger.warn(snap.error().toString(), "SubnetEnumerator");
 *       return {};
 *   }
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<T>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    // Access value (throws if error)
    T& value() {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    T valueOr(const T& defaultValue) const {
        return isOk() ? std::get<T>(data_) : defaultValue;
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void (no value, only success/error)
template<typename E>
class Result<void, E> {
public:
    Result() : data_(OkType{}) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<OkType>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

private:
    struct OkType {};
    std::variant<OkType, E> data_;
};

using VoidResult = Result<void, Error>;

inline VoidResult Ok() {
    return VoidResult();
}

} // namespace LanScout
