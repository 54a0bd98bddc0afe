#ifndef LANSHARE_ERRORS_HPP
#define LANSHARE_ERRORS_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind {
    NetworkTimeout,
    HashMismatch,
    NotFound,
    NoProviders,
    InsufficientChunks,
    StorageIO
};

const char* to_string(ErrorKind kind);

/**
 * @brief Error raised by the sharing core. The kind lets callers tell a
 * missing chunk apart from a storage failure without parsing messages.
 */
class P2PError : public std::runtime_error {
public:
    P2PError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Thrown by the wire codecs on truncated or malformed input.
class SerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif // LANSHARE_ERRORS_HPP
