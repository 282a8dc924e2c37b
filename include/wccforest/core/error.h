#ifndef WCCFOREST_CORE_ERROR_H_
#define WCCFOREST_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace wccforest {
namespace core {

/**
 * @brief Base class for all wccforest errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        TIMEOUT = 4,
        RESOURCE_EXHAUSTED = 5,
        INTERNAL = 6,
        CONFLICT = 7,             // Concurrent writer changed a head or flag we depended on
        UNAVAILABLE = 8,          // Store or oracle unreachable
        STRUCTURAL_VIOLATION = 9, // Cycle, fan-out or branching chain; needs a manual rebuild
        CANCELLED = 10
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Transient errors are retried at unit-of-work granularity
 */
inline bool is_transient(Error::Code code) {
    return code == Error::Code::CONFLICT ||
           code == Error::Code::TIMEOUT ||
           code == Error::Code::UNAVAILABLE;
}

const char* code_name(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message) 
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message) 
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating resource already exists
 */
class AlreadyExistsError : public Error {
public:
    explicit AlreadyExistsError(const std::string& message) 
        : Error(message, Code::ALREADY_EXISTS) {}
};

/**
 * @brief Error indicating operation timeout
 */
class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message) 
        : Error(message, Code::TIMEOUT) {}
};

/**
 * @brief Error indicating resource exhaustion
 */
class ResourceExhaustedError : public Error {
public:
    explicit ResourceExhaustedError(const std::string& message) 
        : Error(message, Code::RESOURCE_EXHAUSTED) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message) 
        : Error(message, Code::INTERNAL) {}
};

/**
 * @brief A commit precondition no longer holds
 */
class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message) 
        : Error(message, Code::CONFLICT) {}
};

/**
 * @brief Store or oracle cannot be reached
 */
class UnavailableError : public Error {
public:
    explicit UnavailableError(const std::string& message) 
        : Error(message, Code::UNAVAILABLE) {}
};

/**
 * @brief Forest or chain invariant broken
 */
class StructuralViolationError : public Error {
public:
    explicit StructuralViolationError(const std::string& message) 
        : Error(message, Code::STRUCTURAL_VIOLATION) {}
};

/**
 * @brief Work abandoned before it ran
 */
class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message) 
        : Error(message, Code::CANCELLED) {}
};

} // namespace core
} // namespace wccforest

#endif // WCCFOREST_CORE_ERROR_H_
