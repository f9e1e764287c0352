#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace photolink::network {

enum class ControlType : std::uint8_t {
    HANDSHAKE        = 0x00,
    HANDSHAKE_ACK    = 0x01,
    HEARTBEAT        = 0x02,
    HEARTBEAT_ACK    = 0x03,
    DISCONNECT       = 0x0F,

    VOICE_START      = 0x10,
    VOICE_DATA       = 0x11,
    VOICE_END        = 0x12,
    VOICE_CANCEL     = 0x13,

    AI_PROCESSING    = 0x20,
    AI_RESPONSE_TEXT = 0x21,
    AI_RESPONSE_TTS  = 0x22,
    USER_TRANSCRIPT  = 0x23,
    AI_ERROR         = 0x2F,

    DISPLAY_TEXT     = 0x30,
    DISPLAY_CLEAR    = 0x31,
    DISPLAY_STATUS   = 0x32,

    SYSTEM_STATUS    = 0xF0,
    SYSTEM_CONFIG    = 0xF1,
    SYSTEM_ERROR     = 0xFF
};

struct ControlMessage {
    std::string id;
    ControlType type;
    std::int64_t timestamp;
    std::optional<std::string> payload;
    std::optional<std::vector<std::uint8_t>> binary_data;

    static ControlMessage create(ControlType type, std::optional<std::string> payload = std::nullopt);

    // Single JSON object followed by '\n'.
    std::string serialize() const;

    // nullopt for malformed JSON or an unknown type.
    static std::optional<ControlMessage> parse(const std::string& line);
};

std::optional<ControlType> control_type_from_int(int value);
std::string control_type_name(ControlType type);

}
