#pragma once

#include <string>
#include <cstdint>
#include <utility>

namespace subvault {

enum class ErrorCode {
    OK = 0,
    INVALID_ADDRESS,
    INVALID_CONFIG,
    NETWORK_ERROR,
    DATABASE_ERROR,
    NOT_REGISTERED,
    SUBNET_FULL,
    TIMEOUT,
    VALIDATION_FAILED,
    SERIALIZATION_ERROR,
    CRYPTO_ERROR,
    FILE_NOT_FOUND,
    PERMISSION_DENIED,
    ALREADY_EXISTS,
    NOT_FOUND,
    INSUFFICIENT_SPACE
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string context;
    
    Error() : code(ErrorCode::OK) {}
    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}
    
    std::string describe() const;
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}
    
    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }
    
    
private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}
    
    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }
    
private:
    Error error_;
    bool hasValue_;
};

const char* errorToString(ErrorCode code);
void throwIfError(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define SUBVAULT_CHECK(expr, code, msg) if (!(expr)) return subvault::makeError(code, msg)

}
