#ifndef VAULT_STORAGE_ERROR_HPP
#define VAULT_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vault::storage {

enum class ErrorKind {
    INVALID_ARGUMENT,
    NOT_FOUND,
    UNAUTHORIZED,
    FAULT
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorKind::NOT_FOUND: return "Not found";
        case ErrorKind::UNAUTHORIZED: return "Unauthorized";
        case ErrorKind::FAULT: return "Fault";
        default: return "Undefined error";
    }
}

class StorageError : public std::runtime_error {
public:
    StorageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Malformed input or a reference that escapes the client namespace
class InvalidArgumentError : public StorageError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : StorageError(ErrorKind::INVALID_ARGUMENT, message) {}
};

class NotFoundError : public StorageError {
public:
    explicit NotFoundError(const std::string& message)
        : StorageError(ErrorKind::NOT_FOUND, message) {}
};

class UnauthorizedError : public StorageError {
public:
    explicit UnauthorizedError(const std::string& message)
        : StorageError(ErrorKind::UNAUTHORIZED, message) {}
};

// Unexpected I/O failure. Messages must not carry filesystem paths.
class FaultError : public StorageError {
public:
    explicit FaultError(const std::string& message)
        : StorageError(ErrorKind::FAULT, message) {}
};

} // namespace vault::storage

#endif // VAULT_STORAGE_ERROR_HPP
