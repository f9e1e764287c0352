#include "photolink/network/photo_protocol.hpp"
#include <algorithm>
#include <cstdio>

namespace photolink::network {

namespace {
    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) {
            throw ProtocolException(ProtocolError::INVALID_LENGTH, "Insufficient data for uint16");
        }
        std::uint16_t value = static_cast<std::uint16_t>((data[0] << 8) | data[1]);
        data = data.subspan(2);
        return value;
    }

    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) {
            throw ProtocolException(ProtocolError::INVALID_LENGTH, "Insufficient data for uint32");
        }
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }

    void expect_header(std::span<const std::uint8_t> data, PacketKind kind, std::size_t min_size, bool exact) {
        if (data.empty()) {
            throw ProtocolException(ProtocolError::INVALID_LENGTH, "Empty packet");
        }
        if (data[0] != static_cast<std::uint8_t>(kind)) {
            throw ProtocolException(ProtocolError::INVALID_TYPE,
                "Expected " + packet_kind_name(static_cast<std::uint8_t>(kind)) +
                " packet, got " + packet_kind_name(data[0]));
        }
        if (exact ? data.size() != min_size : data.size() < min_size) {
            throw ProtocolException(ProtocolError::INVALID_LENGTH,
                packet_kind_name(data[0]) + " packet has invalid length " + std::to_string(data.size()));
        }
    }
}

std::vector<std::uint8_t> encode_start(std::uint32_t total_size, std::uint32_t total_chunks,
                                       std::span<const std::uint8_t> md5) {
    if (md5.size() != crypto::MD5_DIGEST_SIZE) {
        throw ProtocolException(ProtocolError::INVALID_ARGUMENT,
            "MD5 must be 16 bytes, got " + std::to_string(md5.size()));
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(START_PACKET_SIZE);
    buffer.push_back(static_cast<std::uint8_t>(PacketKind::START));
    write_uint32(buffer, total_size);
    write_uint32(buffer, total_chunks);
    buffer.insert(buffer.end(), md5.begin(), md5.end());
    return buffer;
}

std::vector<std::uint8_t> encode_data(std::uint32_t chunk_index, std::span<const std::uint8_t> payload,
                                      std::uint32_t max_chunk_size) {
    if (payload.size() > max_chunk_size || payload.size() > 0xFFFF) {
        throw ProtocolException(ProtocolError::PAYLOAD_TOO_LARGE,
            "Chunk payload of " + std::to_string(payload.size()) + " bytes exceeds " +
            std::to_string(max_chunk_size));
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(DATA_HEADER_SIZE + payload.size());
    buffer.push_back(static_cast<std::uint8_t>(PacketKind::DATA));
    write_uint16(buffer, static_cast<std::uint16_t>(payload.size()));
    write_uint32(buffer, chunk_index);
    write_uint32(buffer, crypto::compute_crc32(payload));
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    return buffer;
}

std::vector<std::uint8_t> encode_end(StatusCode status) {
    return {static_cast<std::uint8_t>(PacketKind::END), static_cast<std::uint8_t>(status)};
}

std::vector<std::uint8_t> encode_ack(std::uint32_t chunk_index, StatusCode status) {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(ACK_PACKET_SIZE);
    buffer.push_back(static_cast<std::uint8_t>(PacketKind::ACK));
    write_uint32(buffer, chunk_index);
    buffer.push_back(static_cast<std::uint8_t>(status));
    return buffer;
}

std::vector<std::uint8_t> encode_retry(std::uint32_t chunk_index) {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(RETRY_PACKET_SIZE);
    buffer.push_back(static_cast<std::uint8_t>(PacketKind::RETRY));
    write_uint32(buffer, chunk_index);
    return buffer;
}

StartPacket decode_start(std::span<const std::uint8_t> data) {
    expect_header(data, PacketKind::START, START_PACKET_SIZE, true);
    data = data.subspan(1);

    StartPacket packet{};
    packet.total_size = read_uint32(data);
    packet.total_chunks = read_uint32(data);
    std::copy(data.begin(), data.begin() + crypto::MD5_DIGEST_SIZE, packet.md5.begin());
    return packet;
}

DataPacket decode_data(std::span<const std::uint8_t> data) {
    expect_header(data, PacketKind::DATA, DATA_HEADER_SIZE, false);
    data = data.subspan(1);

    DataPacket packet{};
    std::uint16_t length = read_uint16(data);
    packet.chunk_index = read_uint32(data);
    packet.expected_crc = read_uint32(data);

    if (data.size() != length) {
        throw ProtocolException(ProtocolError::INVALID_LENGTH,
            "DATA packet declares " + std::to_string(length) + " payload bytes, carries " +
            std::to_string(data.size()));
    }

    packet.payload.assign(data.begin(), data.end());
    packet.actual_crc = crypto::compute_crc32(packet.payload);
    packet.is_valid = packet.actual_crc == packet.expected_crc;
    return packet;
}

EndPacket decode_end(std::span<const std::uint8_t> data) {
    expect_header(data, PacketKind::END, END_PACKET_SIZE, true);
    return EndPacket{static_cast<StatusCode>(data[1])};
}

AckPacket decode_ack(std::span<const std::uint8_t> data) {
    expect_header(data, PacketKind::ACK, ACK_PACKET_SIZE, true);
    data = data.subspan(1);

    AckPacket packet{};
    packet.chunk_index = read_uint32(data);
    packet.status = static_cast<StatusCode>(data[0]);
    return packet;
}

RetryPacket decode_retry(std::span<const std::uint8_t> data) {
    expect_header(data, PacketKind::RETRY, RETRY_PACKET_SIZE, true);
    data = data.subspan(1);

    RetryPacket packet{};
    packet.chunk_index = read_uint32(data);
    return packet;
}

bool is_packet_kind(std::uint8_t value) {
    return value >= static_cast<std::uint8_t>(PacketKind::START) &&
           value <= static_cast<std::uint8_t>(PacketKind::RETRY);
}

PacketKind packet_kind_of(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        throw ProtocolException(ProtocolError::INVALID_LENGTH, "Empty packet");
    }
    if (!is_packet_kind(data[0])) {
        throw ProtocolException(ProtocolError::INVALID_TYPE, "Unknown packet type " + packet_kind_name(data[0]));
    }
    return static_cast<PacketKind>(data[0]);
}

std::optional<std::size_t> packet_length(std::span<const std::uint8_t> data) {
    switch (packet_kind_of(data)) {
        case PacketKind::START:
            return START_PACKET_SIZE;
        case PacketKind::DATA:
            if (data.size() < 3) {
                return std::nullopt;
            }
            return DATA_HEADER_SIZE + ((static_cast<std::size_t>(data[1]) << 8) | data[2]);
        case PacketKind::END:
            return END_PACKET_SIZE;
        case PacketKind::ACK:
            return ACK_PACKET_SIZE;
        case PacketKind::RETRY:
            return RETRY_PACKET_SIZE;
    }
    throw ProtocolException(ProtocolError::INVALID_TYPE, "Unknown packet type");
}

std::string packet_kind_name(std::uint8_t value) {
    switch (value) {
        case 0x01: return "START";
        case 0x02: return "DATA";
        case 0x03: return "END";
        case 0x04: return "ACK";
        case 0x05: return "RETRY";
        default: {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "UNKNOWN(0x%02X)", value);
            return buffer;
        }
    }
}

std::string status_name(StatusCode status) {
    switch (status) {
        case StatusCode::SUCCESS: return "SUCCESS";
        case StatusCode::CRC_ERROR: return "CRC_ERROR";
        case StatusCode::MD5_ERROR: return "MD5_ERROR";
        case StatusCode::TIMEOUT: return "TIMEOUT";
        case StatusCode::OUT_OF_MEMORY: return "OUT_OF_MEMORY";
        case StatusCode::GENERIC_ERROR: return "GENERIC_ERROR";
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "UNKNOWN(0x%02X)", static_cast<unsigned>(status));
    return buffer;
}

}
