#pragma once

#include <string>
#include <utility>
#include <variant>

namespace scenegen {

enum class FailureKind {
    kPlacement,   // no valid location within the sampling budget
    kDefinition,  // no catalog definition fits the role
    kHypercube,   // whole-attempt retries exhausted
};

inline const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::kPlacement:
            return "placement";
        case FailureKind::kDefinition:
            return "definition";
        case FailureKind::kHypercube:
            return "hypercube";
    }
    return "unknown";
}

struct Failure {
    FailureKind kind = FailureKind::kPlacement;
    std::string message;
};

inline Failure placement_failure(std::string message) {
    return Failure{FailureKind::kPlacement, std::move(message)};
}

inline Failure definition_failure(std::string message) {
    return Failure{FailureKind::kDefinition, std::move(message)};
}

// Value-or-failure return for the retryable paths.
template <typename T, typename E = Failure>
class Result {
private:
    // Wrapper to disambiguate when T and E are the same type
    struct ErrorWrapper {
        E error;
        explicit ErrorWrapper(E e) : error(std::move(e)) {}
    };

public:
    static Result ok(T value) { return Result(std::move(value), true); }
    static Result err(E error) { return Result(ErrorWrapper(std::move(error)), false); }

    [[nodiscard]] bool is_ok() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_err() const { return std::holds_alternative<ErrorWrapper>(data_); }

    // std::bad_variant_access on the wrong branch.
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::move(std::get<T>(data_)); }

    [[nodiscard]] const E& error() const& { return std::get<ErrorWrapper>(data_).error; }

    [[nodiscard]] T value_or(T fallback) const& { return is_ok() ? value() : std::move(fallback); }

private:
    explicit Result(T value, bool) : data_(std::move(value)) {}
    explicit Result(ErrorWrapper error, bool) : data_(std::move(error)) {}

    std::variant<T, ErrorWrapper> data_;
};

template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) {
        Result r(false);
        r.error_ = std::move(error);
        return r;
    }

    [[nodiscard]] bool is_ok() const { return ok_; }
    [[nodiscard]] bool is_err() const { return !ok_; }
    [[nodiscard]] const E& error() const { return error_; }

private:
    explicit Result(bool ok) : ok_(ok) {}

    bool ok_ = false;
    E error_{};
};

}  // namespace scenegen
