#pragma once

#include "photolink/network/control_message.hpp"
#include "photolink/network/photo_protocol.hpp"
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace photolink::network {

struct BinaryFrame {
    std::vector<std::uint8_t> bytes;
};

using Frame = std::variant<BinaryFrame, ControlMessage>;

// Splits the shared inbound stream into binary packets and JSON control lines.
// The first byte of each frame decides: '{' starts a JSON line, 0x01..0x05 a
// binary packet, anything else is skipped as line noise.
class FrameParser {
public:
    explicit FrameParser(std::size_t max_data_payload = CHUNK_SIZE,
                         std::size_t max_line_length = 64 * 1024);

    std::vector<Frame> feed(std::span<const std::uint8_t> data);
    void reset();

    std::size_t buffered_bytes() const { return buffer_.size() - offset_; }
    std::uint64_t skipped_bytes() const { return skipped_bytes_; }

private:
    bool try_extract_line(std::vector<Frame>& frames);
    bool try_extract_packet(std::vector<Frame>& frames);
    void skip_noise();
    void compact();

    std::size_t max_data_payload_;
    std::size_t max_line_length_;
    std::vector<std::uint8_t> buffer_;
    std::size_t offset_;
    std::uint64_t skipped_bytes_;
};

}
