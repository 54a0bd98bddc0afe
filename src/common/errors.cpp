#include "common/errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NetworkTimeout: return "network_timeout";
        case ErrorKind::HashMismatch: return "hash_mismatch";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::NoProviders: return "no_providers";
        case ErrorKind::InsufficientChunks: return "insufficient_chunks";
        case ErrorKind::StorageIO: return "storage_io";
    }
    return "unknown";
}
