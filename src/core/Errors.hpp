#pragma once

#include <stdexcept>
#include <string>

namespace flowgraph {

enum class ErrorCode {
    Validation,
    NotFound,
    TypeCoercion,
    ExternalCall,
    IterationBudgetExceeded,
    Cancelled,
    InvalidState
};

const char* ToString(ErrorCode code) noexcept;

/**
 * @brief Base class of every error the engine throws.
 *
 * @details
 * Each subclass pins one ErrorCode so callers can either catch the concrete
 * type or inspect code() on the base. what() carries the full message,
 * including any context the engine prepended while propagating it.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Malformed graph, node, condition or definition document.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorCode::Validation, message) {}
};

// Missing state id, node id, tool or provider.
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(ErrorCode::NotFound, message) {}
};

// Operands that cannot be compared numerically or tested for containment.
class TypeCoercionError : public Error {
public:
    explicit TypeCoercionError(const std::string& message)
        : Error(ErrorCode::TypeCoercion, message) {}
};

// A text-generation provider or tool reported a failure.
class ExternalCallError : public Error {
public:
    explicit ExternalCallError(const std::string& message)
        : Error(ErrorCode::ExternalCall, message) {}
};

class IterationBudgetExceeded : public Error {
public:
    explicit IterationBudgetExceeded(int max_iterations)
        : Error(ErrorCode::IterationBudgetExceeded,
                "maximum iterations (" + std::to_string(max_iterations) +
                    ") reached, possible infinite loop"),
          max_iterations_(max_iterations) {}

    int max_iterations() const noexcept { return max_iterations_; }

private:
    int max_iterations_;
};

enum class CancelCause { Requested, DeadlineExceeded };

class CancelledError : public Error {
public:
    explicit CancelledError(CancelCause cause)
        : Error(ErrorCode::Cancelled, cause == CancelCause::DeadlineExceeded
                                          ? "execution timed out"
                                          : "execution cancelled"),
          cause_(cause) {}

    CancelCause cause() const noexcept { return cause_; }

private:
    CancelCause cause_;
};

// An operation that is not legal in the target's current lifecycle state.
class InvalidStateError : public Error {
public:
    explicit InvalidStateError(const std::string& message)
        : Error(ErrorCode::InvalidState, message) {}
};

inline const char* ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Validation:
            return "validation";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::TypeCoercion:
            return "type_coercion";
        case ErrorCode::ExternalCall:
            return "external_call";
        case ErrorCode::IterationBudgetExceeded:
            return "iteration_budget_exceeded";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::InvalidState:
            return "invalid_state";
    }
    return "unknown";
}

}  // namespace flowgraph
