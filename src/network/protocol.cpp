#include "network/protocol.h"
#include <nlohmann/json.hpp>
#include <cstring>
#include <algorithm>

namespace subvault {
namespace network {

using json = nlohmann::json;

static bool isValidCommand(const char command[COMMAND_SIZE]) {
    if (command[0] == 0) return false;
    bool ended = false;
    for (size_t i = 0; i < COMMAND_SIZE; ++i) {
        unsigned char c = static_cast<unsigned char>(command[i]);
        if (c == 0) {
            ended = true;
            continue;
        }
        if (ended) return false;
        if (c < 32 || c > 126) return false;
    }
    return true;
}

static uint32_t payloadChecksum(const uint8_t* data, size_t len) {
    crypto::Hash256 hash = crypto::doubleSha256(data, len);
    uint32_t checksum;
    std::memcpy(&checksum, hash.data(), 4);
    return checksum;
}

std::vector<uint8_t> Message::serialize() const {
    std::vector<uint8_t> out;
    MessageHeader hdr{};
    hdr.magic = PROTOCOL_MAGIC;
    std::memcpy(hdr.command, command.data(), std::min(command.size(), COMMAND_SIZE));
    hdr.length = static_cast<uint32_t>(payload.size());
    hdr.checksum = payloadChecksum(payload.data(), payload.size());
    
    out.resize(sizeof(MessageHeader) + payload.size());
    std::memcpy(out.data(), &hdr, sizeof(MessageHeader));
    if (!payload.empty()) {
        std::memcpy(out.data() + sizeof(MessageHeader), payload.data(), payload.size());
    }
    return out;
}

std::optional<Message> Message::deserialize(const std::vector<uint8_t>& data) {
    Message msg;
    size_t consumed = 0;
    if (parseFrame(data.data(), data.size(), msg, consumed) != FrameStatus::OK) return std::nullopt;
    if (consumed != data.size()) return std::nullopt;
    return msg;
}

Message Message::make(const std::string& command, const std::string& body) {
    Message msg;
    msg.command = command;
    msg.payload.assign(body.begin(), body.end());
    return msg;
}

const char* frameStatusName(FrameStatus status) {
    switch (status) {
        case FrameStatus::INCOMPLETE: return "incomplete";
        case FrameStatus::OK: return "ok";
        case FrameStatus::BAD_MAGIC: return "bad_magic";
        case FrameStatus::BAD_COMMAND: return "bad_command";
        case FrameStatus::TOO_LARGE: return "too_large";
        case FrameStatus::BAD_CHECKSUM: return "bad_checksum";
    }
    return "unknown";
}

FrameStatus parseFrame(const uint8_t* data, size_t len, Message& out, size_t& consumed) {
    consumed = 0;
    if (len < sizeof(MessageHeader)) return FrameStatus::INCOMPLETE;
    
    MessageHeader hdr;
    std::memcpy(&hdr, data, sizeof(MessageHeader));
    if (hdr.magic != PROTOCOL_MAGIC) return FrameStatus::BAD_MAGIC;
    if (!isValidCommand(hdr.command)) return FrameStatus::BAD_COMMAND;
    if (hdr.length > MAX_MESSAGE_SIZE) return FrameStatus::TOO_LARGE;
    
    const size_t total = sizeof(MessageHeader) + static_cast<size_t>(hdr.length);
    if (len < total) return FrameStatus::INCOMPLETE;
    
    const uint8_t* body = data + sizeof(MessageHeader);
    if (payloadChecksum(body, hdr.length) != hdr.checksum) return FrameStatus::BAD_CHECKSUM;
    
    out.command = std::string(hdr.command, strnlen(hdr.command, COMMAND_SIZE));
    out.payload.assign(body, body + hdr.length);
    consumed = total;
    return FrameStatus::OK;
}

std::string RetrieveRequest::signingMessage() const {
    return std::to_string(nonce) + "." + dendriteHotkey + "." + axonHotkey + "." + crypto::sha256Hex(key);
}

std::string RetrieveRequest::toJson() const {
    json j;
    j["key"] = key;
    j["dendrite_hotkey"] = dendriteHotkey;
    j["axon_hotkey"] = axonHotkey;
    j["nonce"] = nonce;
    j["signature"] = signature;
    return j.dump();
}

std::optional<RetrieveRequest> RetrieveRequest::fromJson(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (!j.contains("key") || !j["key"].is_string()) return std::nullopt;
    if (!j.contains("dendrite_hotkey") || !j["dendrite_hotkey"].is_string()) return std::nullopt;
    if (!j.contains("axon_hotkey") || !j["axon_hotkey"].is_string()) return std::nullopt;
    if (!j.contains("nonce") || !j["nonce"].is_number_unsigned()) return std::nullopt;
    if (!j.contains("signature") || !j["signature"].is_string()) return std::nullopt;
    
    RetrieveRequest req;
    req.key = j["key"].get<std::string>();
    req.dendriteHotkey = j["dendrite_hotkey"].get<std::string>();
    req.axonHotkey = j["axon_hotkey"].get<std::string>();
    req.nonce = j["nonce"].get<uint64_t>();
    req.signature = j["signature"].get<std::string>();
    return req;
}

std::string RetrieveResponse::toJson() const {
    json j;
    j["status"] = status;
    j["data"] = data;
    j["message"] = message;
    return j.dump();
}

std::optional<RetrieveResponse> RetrieveResponse::fromJson(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (!j.contains("status") || !j["status"].is_number_integer()) return std::nullopt;
    
    RetrieveResponse resp;
    resp.status = j["status"].get<int>();
    if (j.contains("data") && j["data"].is_string()) resp.data = j["data"].get<std::string>();
    if (j.contains("message") && j["message"].is_string()) resp.message = j["message"].get<std::string>();
    return resp;
}

RetrieveResponse RetrieveResponse::success(const std::string& data) {
    RetrieveResponse resp;
    resp.status = static_cast<int>(StatusCode::OK);
    resp.data = data;
    return resp;
}

RetrieveResponse RetrieveResponse::failure(StatusCode code, const std::string& message) {
    RetrieveResponse resp;
    resp.status = static_cast<int>(code);
    resp.message = message;
    return resp;
}

}
}
