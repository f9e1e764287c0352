#include "photolink/network/byte_stream.hpp"
#include "photolink/core/logger.hpp"
#include <cerrno>
#include <poll.h>
#include <termios.h>

namespace photolink::network {

TcpByteStream::TcpByteStream(tcp::socket socket)
    : socket_(std::move(socket))
    , shut_down_(false) {

    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    remote_endpoint_ = ec ? "tcp:unknown" : "tcp:" + endpoint.address().to_string() + ":" + std::to_string(endpoint.port());

    socket_.set_option(tcp::no_delay(true), ec);
    if (ec) {
        LOG_WARN("Failed to disable Nagle on {}: {}", remote_endpoint_, ec.message());
    }
}

TcpByteStream::~TcpByteStream() {
    close();
}

std::size_t TcpByteStream::read_some(std::span<std::uint8_t> buffer) {
    boost::system::error_code ec;
    std::size_t n = socket_.read_some(boost::asio::buffer(buffer.data(), buffer.size()), ec);
    if (ec == boost::asio::error::eof) {
        return 0;
    }
    if (ec) {
        if (shut_down_) {
            return 0;
        }
        throw boost::system::system_error(ec, "read from " + remote_endpoint_);
    }
    return n;
}

void TcpByteStream::write_all(std::span<const std::uint8_t> data) {
    boost::asio::write(socket_, boost::asio::buffer(data.data(), data.size()));
}

void TcpByteStream::shutdown() {
    shut_down_ = true;
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
}

void TcpByteStream::close() {
    shut_down_ = true;
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
}

bool TcpByteStream::is_open() const {
    return socket_.is_open() && !shut_down_;
}

SerialByteStream::SerialByteStream(boost::asio::io_context& io_context, const std::string& device,
                                   unsigned int baud_rate)
    : port_(io_context)
    , device_(device)
    , shut_down_(false) {

    port_.open(device);
    port_.set_option(boost::asio::serial_port_base::baud_rate(baud_rate));
    port_.set_option(boost::asio::serial_port_base::character_size(8));
    port_.set_option(boost::asio::serial_port_base::parity(boost::asio::serial_port_base::parity::none));
    port_.set_option(boost::asio::serial_port_base::stop_bits(boost::asio::serial_port_base::stop_bits::one));
    port_.set_option(boost::asio::serial_port_base::flow_control(boost::asio::serial_port_base::flow_control::none));
}

SerialByteStream::~SerialByteStream() {
    close();
}

std::size_t SerialByteStream::read_some(std::span<std::uint8_t> buffer) {
    // A blocking tty read cannot be interrupted from another thread, so poll in short slices.
    while (!shut_down_) {
        pollfd pfd{port_.native_handle(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw boost::system::system_error(errno, boost::system::system_category(), "poll " + device_);
        }
        if (ready == 0) {
            continue;
        }
        if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
            return 0;
        }

        boost::system::error_code ec;
        std::size_t n = port_.read_some(boost::asio::buffer(buffer.data(), buffer.size()), ec);
        if (ec == boost::asio::error::eof) {
            return 0;
        }
        if (ec) {
            throw boost::system::system_error(ec, "read from " + device_);
        }
        return n;
    }
    return 0;
}

void SerialByteStream::write_all(std::span<const std::uint8_t> data) {
    boost::asio::write(port_, boost::asio::buffer(data.data(), data.size()));
}

void SerialByteStream::flush() {
    if (::tcdrain(port_.native_handle()) != 0) {
        throw boost::system::system_error(errno, boost::system::system_category(), "drain " + device_);
    }
}

void SerialByteStream::shutdown() {
    shut_down_ = true;
}

void SerialByteStream::close() {
    shut_down_ = true;
    boost::system::error_code ec;
    if (port_.is_open()) {
        port_.close(ec);
    }
}

bool SerialByteStream::is_open() const {
    return port_.is_open() && !shut_down_;
}

}
