#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <span>
#include <string>

namespace photolink::network {

using boost::asio::ip::tcp;

// Blocking, bidirectional byte stream owned by the connection manager.
// I/O failures surface as boost::system::system_error.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Blocks until data arrives; returns 0 on orderly end of stream.
    virtual std::size_t read_some(std::span<std::uint8_t> buffer) = 0;
    virtual void write_all(std::span<const std::uint8_t> data) = 0;
    virtual void flush() = 0;

    // Safe to call from another thread; wakes a blocked read_some.
    virtual void shutdown() = 0;
    virtual void close() = 0;

    virtual bool is_open() const = 0;
    virtual std::string describe() const = 0;
};

class TcpByteStream : public ByteStream {
public:
    explicit TcpByteStream(tcp::socket socket);
    ~TcpByteStream() override;

    std::size_t read_some(std::span<std::uint8_t> buffer) override;
    void write_all(std::span<const std::uint8_t> data) override;
    void flush() override {}

    void shutdown() override;
    void close() override;

    bool is_open() const override;
    std::string describe() const override { return remote_endpoint_; }

private:
    tcp::socket socket_;
    std::string remote_endpoint_;
    std::atomic<bool> shut_down_;
};

// RFCOMM TTY bound with `rfcomm bind`, e.g. /dev/rfcomm0.
class SerialByteStream : public ByteStream {
public:
    SerialByteStream(boost::asio::io_context& io_context, const std::string& device,
                     unsigned int baud_rate = 115200);
    ~SerialByteStream() override;

    std::size_t read_some(std::span<std::uint8_t> buffer) override;
    void write_all(std::span<const std::uint8_t> data) override;
    void flush() override;

    void shutdown() override;
    void close() override;

    bool is_open() const override;
    std::string describe() const override { return device_; }

private:
    boost::asio::serial_port port_;
    std::string device_;
    std::atomic<bool> shut_down_;
};

}
