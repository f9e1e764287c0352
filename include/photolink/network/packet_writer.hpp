#pragma once

#include <cstdint>
#include <span>

namespace photolink::network {

// Write access lent to transfer sessions. Each call writes one whole packet
// and flushes it; failures throw boost::system::system_error.
class PacketWriter {
public:
    virtual ~PacketWriter() = default;
    virtual void write_packet(std::span<const std::uint8_t> packet) = 0;
};

}
