#pragma once

#include "crypto/crypto.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace subvault {
namespace network {

// Bytes 'S' 'V' 'L' 'T' on the wire.
constexpr uint32_t PROTOCOL_MAGIC = 0x544C5653;
constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;
constexpr size_t COMMAND_SIZE = 12;

constexpr const char* CMD_RETRIEVE = "retrieve";
constexpr const char* CMD_RESPONSE = "response";

struct MessageHeader {
    uint32_t magic;
    char command[COMMAND_SIZE];
    uint32_t length;
    uint32_t checksum;
};

static_assert(sizeof(MessageHeader) == 24, "wire header is 24 bytes");

struct Message {
    std::string command;
    std::vector<uint8_t> payload;
    std::string from;
    uint64_t timestamp = 0;
    
    std::vector<uint8_t> serialize() const;
    static std::optional<Message> deserialize(const std::vector<uint8_t>& data);
    
    static Message make(const std::string& command, const std::string& body);
    std::string body() const { return std::string(payload.begin(), payload.end()); }
};

enum class FrameStatus {
    INCOMPLETE,
    OK,
    BAD_MAGIC,
    BAD_COMMAND,
    TOO_LARGE,
    BAD_CHECKSUM
};

const char* frameStatusName(FrameStatus status);

// Decodes one frame from the front of `data`. On OK, `consumed` is the frame
// length; on INCOMPLETE more bytes are needed; anything else is a violation.
FrameStatus parseFrame(const uint8_t* data, size_t len, Message& out, size_t& consumed);

enum class StatusCode : int {
    OK = 200,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404
};

struct RetrieveRequest {
    std::string key;
    std::string dendriteHotkey;
    std::string axonHotkey;
    uint64_t nonce = 0;
    std::string signature;
    
    // "<nonce>.<dendriteHotkey>.<axonHotkey>.<sha256Hex(key)>"
    std::string signingMessage() const;
    std::string toJson() const;
    static std::optional<RetrieveRequest> fromJson(const std::string& body);
};

struct RetrieveResponse {
    int status = static_cast<int>(StatusCode::OK);
    std::string data;
    std::string message;
    
    bool ok() const { return status == static_cast<int>(StatusCode::OK); }
    std::string toJson() const;
    static std::optional<RetrieveResponse> fromJson(const std::string& body);
    
    static RetrieveResponse success(const std::string& data);
    static RetrieveResponse failure(StatusCode code, const std::string& message);
};

}
}
