#include "photolink/network/channel_strategy.hpp"
#include "photolink/core/config.hpp"
#include "photolink/core/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace photolink::network {

std::string PeerAddress::peer_id() const {
    if (!host.empty()) {
        return host;
    }
    return device;
}

PeerAddress PeerAddress::from_config(const core::Config& config) {
    PeerAddress peer;
    peer.host = config.get_string("peer.host", "127.0.0.1");
    peer.service = config.get_string("peer.service", "photolink");
    peer.device = config.get_string("peer.device");
    peer.channels = config.get_port_list("peer.channels");
    peer.channel_base_port = static_cast<std::uint16_t>(config.get_int("peer.channel_base_port", 7000));
    return peer;
}

std::unique_ptr<ByteStream> ServiceLookupStrategy::open(boost::asio::io_context& io_context, const PeerAddress& peer) {
    if (peer.host.empty() || peer.service.empty()) {
        throw std::invalid_argument("service lookup needs a host and a service name");
    }

    tcp::resolver resolver(io_context);
    auto endpoints = resolver.resolve(peer.host, peer.service);

    tcp::socket socket(io_context);
    boost::asio::connect(socket, endpoints);

    LOG_DEBUG("Resolved service '{}' on {}", peer.service, peer.host);
    return std::make_unique<TcpByteStream>(std::move(socket));
}

std::unique_ptr<ByteStream> SerialDeviceStrategy::open(boost::asio::io_context& io_context, const PeerAddress& peer) {
    if (peer.device.empty()) {
        throw std::invalid_argument("no RFCOMM device configured");
    }
    return std::make_unique<SerialByteStream>(io_context, peer.device);
}

std::unique_ptr<ByteStream> FixedChannelStrategy::open(boost::asio::io_context& io_context, const PeerAddress& peer) {
    if (peer.host.empty() || peer.channels.empty()) {
        throw std::invalid_argument("fixed channels need a host and at least one channel");
    }

    boost::system::error_code last_error = boost::asio::error::host_unreachable;
    tcp::resolver resolver(io_context);

    for (auto channel : peer.channels) {
        auto port = static_cast<std::uint16_t>(peer.channel_base_port + channel);

        boost::system::error_code ec;
        auto endpoints = resolver.resolve(peer.host, std::to_string(port),
                                          tcp::resolver::numeric_service, ec);
        if (!ec) {
            tcp::socket socket(io_context);
            boost::asio::connect(socket, endpoints, ec);
            if (!ec) {
                LOG_DEBUG("Connected on channel {} (port {})", channel, port);
                return std::make_unique<TcpByteStream>(std::move(socket));
            }
            boost::system::error_code ignored;
            socket.close(ignored);
        }

        LOG_DEBUG("Channel {} (port {}) failed: {}", channel, port, ec.message());
        last_error = ec;
    }

    throw boost::system::system_error(last_error, "all fixed channels failed");
}

std::vector<std::shared_ptr<ChannelStrategy>> default_strategies() {
    return {
        std::make_shared<ServiceLookupStrategy>(),
        std::make_shared<SerialDeviceStrategy>(),
        std::make_shared<FixedChannelStrategy>()
    };
}

std::shared_ptr<ChannelStrategy> select_strategy(const std::vector<std::shared_ptr<ChannelStrategy>>& strategies,
                                                 int attempt) {
    if (strategies.empty()) {
        throw std::invalid_argument("no channel strategies configured");
    }
    auto index = static_cast<std::size_t>(std::clamp(attempt, 1, static_cast<int>(strategies.size())) - 1);
    return strategies[index];
}

}
