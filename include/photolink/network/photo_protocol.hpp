#pragma once

#include "photolink/crypto/hash.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace photolink::network {

constexpr std::uint32_t CHUNK_SIZE = 4096;
constexpr std::uint32_t MAX_CHUNKS = 2048;
constexpr std::uint32_t MAX_PHOTO_SIZE = 5 * 1024 * 1024;
constexpr int MAX_RETRY_COUNT = 3;
constexpr int ACK_TIMEOUT_MS = 5000;
constexpr int SENDER_TRANSFER_TIMEOUT_MS = 60000;
constexpr int RECEIVER_TRANSFER_TIMEOUT_MS = 30000;
constexpr int CHUNK_DELAY_MS = 10;

constexpr std::size_t START_PACKET_SIZE = 25;
constexpr std::size_t DATA_HEADER_SIZE = 11;
constexpr std::size_t END_PACKET_SIZE = 2;
constexpr std::size_t ACK_PACKET_SIZE = 6;
constexpr std::size_t RETRY_PACKET_SIZE = 5;

enum class PacketKind : std::uint8_t {
    START = 0x01,
    DATA  = 0x02,
    END   = 0x03,
    ACK   = 0x04,
    RETRY = 0x05
};

enum class StatusCode : std::uint8_t {
    SUCCESS       = 0x00,
    CRC_ERROR     = 0x01,
    MD5_ERROR     = 0x02,
    TIMEOUT       = 0x03,
    OUT_OF_MEMORY = 0x04,
    GENERIC_ERROR = 0xFF
};

enum class ProtocolError {
    INVALID_LENGTH,
    INVALID_TYPE,
    INVALID_ARGUMENT,
    PAYLOAD_TOO_LARGE
};

class ProtocolException : public std::runtime_error {
public:
    ProtocolException(ProtocolError error, const std::string& message)
        : std::runtime_error(message), error_(error) {}

    ProtocolError error() const { return error_; }

private:
    ProtocolError error_;
};

struct StartPacket {
    std::uint32_t total_size;
    std::uint32_t total_chunks;
    crypto::Md5Digest md5;
};

struct DataPacket {
    std::uint32_t chunk_index;
    std::vector<std::uint8_t> payload;
    std::uint32_t expected_crc;  // carried on the wire
    std::uint32_t actual_crc;    // recomputed over payload
    bool is_valid;
};

struct EndPacket {
    StatusCode status;
};

struct AckPacket {
    std::uint32_t chunk_index;
    StatusCode status;
};

struct RetryPacket {
    std::uint32_t chunk_index;
};

std::vector<std::uint8_t> encode_start(std::uint32_t total_size, std::uint32_t total_chunks,
                                       std::span<const std::uint8_t> md5);
std::vector<std::uint8_t> encode_data(std::uint32_t chunk_index, std::span<const std::uint8_t> payload,
                                      std::uint32_t max_chunk_size = CHUNK_SIZE);
std::vector<std::uint8_t> encode_end(StatusCode status);
std::vector<std::uint8_t> encode_ack(std::uint32_t chunk_index, StatusCode status);
std::vector<std::uint8_t> encode_retry(std::uint32_t chunk_index);

StartPacket decode_start(std::span<const std::uint8_t> data);
DataPacket decode_data(std::span<const std::uint8_t> data);
EndPacket decode_end(std::span<const std::uint8_t> data);
AckPacket decode_ack(std::span<const std::uint8_t> data);
RetryPacket decode_retry(std::span<const std::uint8_t> data);

bool is_packet_kind(std::uint8_t value);
PacketKind packet_kind_of(std::span<const std::uint8_t> data);

// Total length of the packet starting at data[0]; nullopt until a DATA header is complete.
std::optional<std::size_t> packet_length(std::span<const std::uint8_t> data);

std::string packet_kind_name(std::uint8_t value);
std::string status_name(StatusCode status);

}
