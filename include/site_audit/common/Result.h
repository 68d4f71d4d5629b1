#pragma once

#include <string>
#include <utility>

namespace site_audit {

// Outcome of an operation whose failure is an expected, per-item result
// rather than an exceptional condition.
template <typename T, typename E>
struct Result {
    bool success = false;
    T value{};
    E error{};
    std::string message;

    static Result<T, E> Success(T value, const std::string& message = "") {
        Result<T, E> r;
        r.success = true;
        r.value = std::move(value);
        r.message = message;
        return r;
    }

    static Result<T, E> Failure(E error, const std::string& message) {
        Result<T, E> r;
        r.success = false;
        r.error = error;
        r.message = message;
        return r;
    }

    explicit operator bool() const { return success; }
};

} // namespace site_audit
