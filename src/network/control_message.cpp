#include "photolink/network/control_message.hpp"
#include "photolink/crypto/encoding.hpp"
#include "photolink/core/logger.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <random>

namespace photolink::network {

namespace {
    std::int64_t now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string generate_message_id() {
        static std::atomic<std::uint64_t> counter{0};
        static const std::uint32_t prefix = []() {
            std::random_device rd;
            return static_cast<std::uint32_t>(rd());
        }();
        return std::to_string(prefix) + "-" + std::to_string(++counter);
    }
}

ControlMessage ControlMessage::create(ControlType type, std::optional<std::string> payload) {
    ControlMessage message;
    message.id = generate_message_id();
    message.type = type;
    message.timestamp = now_ms();
    message.payload = std::move(payload);
    return message;
}

std::string ControlMessage::serialize() const {
    nlohmann::json j;
    j["id"] = id;
    j["type"] = static_cast<int>(type);
    j["timestamp"] = timestamp;
    if (payload) {
        j["payload"] = *payload;
    }
    if (binary_data) {
        j["binaryData"] = crypto::base64_encode(*binary_data);
    }
    return j.dump() + "\n";
}

std::optional<ControlMessage> ControlMessage::parse(const std::string& line) {
    nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("Dropping malformed control message ({} bytes)", line.size());
        return std::nullopt;
    }

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_number_integer()) {
        LOG_WARN("Dropping control message without a type");
        return std::nullopt;
    }

    auto type = control_type_from_int(type_it->get<int>());
    if (!type) {
        LOG_WARN("Dropping control message with unknown type {}", type_it->get<int>());
        return std::nullopt;
    }

    ControlMessage message;
    message.type = *type;

    auto id_it = j.find("id");
    message.id = (id_it != j.end() && id_it->is_string()) ? id_it->get<std::string>() : generate_message_id();

    auto ts_it = j.find("timestamp");
    message.timestamp = (ts_it != j.end() && ts_it->is_number_integer()) ? ts_it->get<std::int64_t>() : now_ms();

    auto payload_it = j.find("payload");
    if (payload_it != j.end() && payload_it->is_string()) {
        message.payload = payload_it->get<std::string>();
    }

    auto binary_it = j.find("binaryData");
    if (binary_it != j.end() && binary_it->is_string()) {
        message.binary_data = crypto::base64_decode(binary_it->get<std::string>());
        if (!message.binary_data) {
            LOG_WARN("Control message {} carries invalid base64, ignoring binary data", message.id);
        }
    }

    return message;
}

std::optional<ControlType> control_type_from_int(int value) {
    switch (value) {
        case 0x00: case 0x01: case 0x02: case 0x03: case 0x0F:
        case 0x10: case 0x11: case 0x12: case 0x13:
        case 0x20: case 0x21: case 0x22: case 0x23: case 0x2F:
        case 0x30: case 0x31: case 0x32:
        case 0xF0: case 0xF1: case 0xFF:
            return static_cast<ControlType>(value);
        default:
            return std::nullopt;
    }
}

std::string control_type_name(ControlType type) {
    switch (type) {
        case ControlType::HANDSHAKE: return "HANDSHAKE";
        case ControlType::HANDSHAKE_ACK: return "HANDSHAKE_ACK";
        case ControlType::HEARTBEAT: return "HEARTBEAT";
        case ControlType::HEARTBEAT_ACK: return "HEARTBEAT_ACK";
        case ControlType::DISCONNECT: return "DISCONNECT";
        case ControlType::VOICE_START: return "VOICE_START";
        case ControlType::VOICE_DATA: return "VOICE_DATA";
        case ControlType::VOICE_END: return "VOICE_END";
        case ControlType::VOICE_CANCEL: return "VOICE_CANCEL";
        case ControlType::AI_PROCESSING: return "AI_PROCESSING";
        case ControlType::AI_RESPONSE_TEXT: return "AI_RESPONSE_TEXT";
        case ControlType::AI_RESPONSE_TTS: return "AI_RESPONSE_TTS";
        case ControlType::USER_TRANSCRIPT: return "USER_TRANSCRIPT";
        case ControlType::AI_ERROR: return "AI_ERROR";
        case ControlType::DISPLAY_TEXT: return "DISPLAY_TEXT";
        case ControlType::DISPLAY_CLEAR: return "DISPLAY_CLEAR";
        case ControlType::DISPLAY_STATUS: return "DISPLAY_STATUS";
        case ControlType::SYSTEM_STATUS: return "SYSTEM_STATUS";
        case ControlType::SYSTEM_CONFIG: return "SYSTEM_CONFIG";
        case ControlType::SYSTEM_ERROR: return "SYSTEM_ERROR";
    }
    return "UNKNOWN";
}

}
