#include "error_handling.h"
#include <stdexcept>

namespace subvault {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_ADDRESS: return "Invalid address";
        case ErrorCode::INVALID_CONFIG: return "Invalid configuration";
        case ErrorCode::NETWORK_ERROR: return "Network error";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        case ErrorCode::NOT_REGISTERED: return "Not registered";
        case ErrorCode::SUBNET_FULL: return "Subnet full";
        case ErrorCode::TIMEOUT: return "Timeout";
        case ErrorCode::VALIDATION_FAILED: return "Validation failed";
        case ErrorCode::SERIALIZATION_ERROR: return "Serialization error";
        case ErrorCode::CRYPTO_ERROR: return "Cryptographic error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::PERMISSION_DENIED: return "Permission denied";
        case ErrorCode::ALREADY_EXISTS: return "Already exists";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::INSUFFICIENT_SPACE: return "Insufficient disk space";
        default: return "Unknown error";
    }
}

std::string Error::describe() const {
    std::string out = std::string(errorToString(code)) + ": " + message;
    if (!context.empty()) out += " [" + context + "]";
    return out;
}

void throwIfError(const Error& error) {
    if (error.code != ErrorCode::OK) {
        throw std::runtime_error(error.describe());
    }
}

Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err(code, message);
    err.context = context;
    return err;
}

}
