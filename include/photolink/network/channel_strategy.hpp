#pragma once

#include "photolink/network/byte_stream.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace photolink::core {
    class Config;
}

namespace photolink::network {

struct PeerAddress {
    std::string host;
    std::string service;
    std::string device;
    std::vector<std::uint16_t> channels;
    std::uint16_t channel_base_port = 7000;

    std::string peer_id() const;

    static PeerAddress from_config(const core::Config& config);
};

// One way of opening the link to a peer. open() either returns a connected
// stream or throws, leaving nothing open behind it.
class ChannelStrategy {
public:
    virtual ~ChannelStrategy() = default;

    virtual std::string name() const = 0;
    virtual std::unique_ptr<ByteStream> open(boost::asio::io_context& io_context, const PeerAddress& peer) = 0;
};

// Resolves peer.service on peer.host (the service record lookup).
class ServiceLookupStrategy : public ChannelStrategy {
public:
    std::string name() const override { return "service-lookup"; }
    std::unique_ptr<ByteStream> open(boost::asio::io_context& io_context, const PeerAddress& peer) override;
};

// Opens an RFCOMM device bound to the peer.
class SerialDeviceStrategy : public ChannelStrategy {
public:
    std::string name() const override { return "serial-device"; }
    std::unique_ptr<ByteStream> open(boost::asio::io_context& io_context, const PeerAddress& peer) override;
};

// Last resort: raw channel numbers in order, each mapped to channel_base_port + channel.
class FixedChannelStrategy : public ChannelStrategy {
public:
    std::string name() const override { return "fixed-channel"; }
    std::unique_ptr<ByteStream> open(boost::asio::io_context& io_context, const PeerAddress& peer) override;
};

std::vector<std::shared_ptr<ChannelStrategy>> default_strategies();

// attempt is 1-based; attempts past the end of the list keep using the last strategy.
std::shared_ptr<ChannelStrategy> select_strategy(const std::vector<std::shared_ptr<ChannelStrategy>>& strategies,
                                                 int attempt);

}
