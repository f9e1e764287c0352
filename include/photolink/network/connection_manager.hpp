#pragma once

#include "photolink/core/observable.hpp"
#include "photolink/network/byte_stream.hpp"
#include "photolink/network/channel_strategy.hpp"
#include "photolink/network/control_message.hpp"
#include "photolink/network/packet_writer.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace photolink::core {
    class Config;
}

namespace photolink::network {

struct Disconnected {};
struct Connecting {};
struct Connected {
    std::string peer_id;
};
struct Failed {
    std::string reason;
};

using ConnectionState = std::variant<Disconnected, Connecting, Connected, Failed>;

std::string describe(const ConnectionState& state);

struct ConnectionOptions {
    std::string device_name = "photolink";
    int max_retries = 5;
    std::chrono::milliseconds connect_base_delay{1500};
    std::chrono::milliseconds connect_step_delay{1000};
    std::chrono::milliseconds connect_max_delay{10000};
    std::chrono::milliseconds heartbeat_interval{10000};
    int max_missed_heartbeats = 3;
    std::chrono::milliseconds reconnect_initial_delay{1000};
    std::chrono::milliseconds reconnect_max_delay{30000};
    bool send_handshake = true;

    // Wait after the given failed attempt (1-based).
    std::chrono::milliseconds connect_delay(int attempt) const;
    // Wait before a reconnection cycle after the given number of failed cycles.
    std::chrono::milliseconds reconnect_delay(int failed_cycles) const;

    static ConnectionOptions from_config(const core::Config& config);
};

// Owns the link to the peer: connect with ordered channel strategies, accept
// an inbound peer, heartbeat liveness, reconnection with capped backoff.
// Inbound binary packets and control messages are dispatched on the io thread.
class ConnectionManager : public PacketWriter {
public:
    using PacketHandler = std::function<void(std::vector<std::uint8_t>)>;
    using MessageHandler = std::function<void(const ControlMessage&)>;
    using StateHandler = std::function<void(const ConnectionState&)>;

    explicit ConnectionManager(ConnectionOptions options = {},
                               std::vector<std::shared_ptr<ChannelStrategy>> strategies = default_strategies());
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    bool connect(const PeerAddress& peer, int max_retries);
    bool connect(const PeerAddress& peer) { return connect(peer, options_.max_retries); }
    bool listen(std::uint16_t port);
    bool attach(std::unique_ptr<ByteStream> stream, const std::string& peer_id);
    bool attach(std::unique_ptr<ByteStream> stream, const PeerAddress& peer);
    void disconnect();

    void write_packet(std::span<const std::uint8_t> packet) override;
    bool send_message(const ControlMessage& message);

    ConnectionState state() const { return state_.get(); }
    bool is_connected() const;
    bool wait_for_connection(std::chrono::milliseconds timeout) const;

    void set_packet_handler(PacketHandler handler);
    void set_message_handler(MessageHandler handler);
    void set_state_handler(StateHandler handler) { state_.set_change_handler(std::move(handler)); }

    boost::asio::io_context& io_context() { return io_context_; }

    // Runs fn on the io thread and waits for it.
    void run_on_io(const std::function<void()>& fn);

    int missed_heartbeats() const { return missed_heartbeats_; }
    std::size_t scheduled_reconnects() const { return scheduled_reconnects_; }
    std::chrono::milliseconds last_reconnect_delay() const;
    std::uint16_t listening_port() const { return listening_port_; }
    const ConnectionOptions& options() const { return options_; }

private:
    void start_connect(const PeerAddress& peer, int max_retries, bool reconnecting);
    void run_connect_attempts(std::uint64_t epoch, PeerAddress peer, int max_retries, bool reconnecting);
    bool wait_connect_delay(std::uint64_t epoch, std::chrono::milliseconds delay);
    std::uint64_t cancel_connect_attempts();
    bool connect_cancelled(std::uint64_t epoch);
    void reap_connect_workers();

    void adopt_stream(std::unique_ptr<ByteStream> stream, const std::string& peer_id, bool outbound);
    void on_connect_failed(std::uint64_t epoch, const std::string& reason, bool reconnecting);
    void teardown(ConnectionState next, bool schedule_reconnect);
    void schedule_reconnect();

    void read_loop(ByteStream* stream, std::uint64_t generation);
    void on_stream_ended(std::uint64_t generation, const std::string& reason);
    void dispatch_packet(std::uint64_t generation, std::vector<std::uint8_t> packet);
    void dispatch_message(std::uint64_t generation, const ControlMessage& message);

    void arm_heartbeat();
    void on_heartbeat_tick(std::uint64_t generation);

    bool write_bytes(std::span<const std::uint8_t> data);

    ConnectionOptions options_;
    std::vector<std::shared_ptr<ChannelStrategy>> strategies_;

    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::thread io_thread_;
    std::atomic<bool> running_;

    core::Observable<ConnectionState> state_;

    // Link, io thread only except where noted.
    std::unique_ptr<ByteStream> stream_;  // written under write_mutex_
    std::mutex write_mutex_;
    std::thread reader_thread_;
    std::atomic<std::uint64_t> generation_;
    boost::asio::steady_timer heartbeat_timer_;
    boost::asio::steady_timer reconnect_timer_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::optional<PeerAddress> last_peer_;
    int failed_reconnect_cycles_;

    struct ConnectWorker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    // A connect attempt whose epoch is no longer current is discarded.
    std::mutex connect_mutex_;
    std::condition_variable connect_cv_;
    std::uint64_t connect_epoch_;
    std::vector<ConnectWorker> connect_workers_;  // io thread, then the destructor

    std::mutex handler_mutex_;
    PacketHandler packet_handler_;
    MessageHandler message_handler_;

    std::atomic<int> missed_heartbeats_;
    std::atomic<std::size_t> scheduled_reconnects_;
    std::atomic<std::int64_t> last_reconnect_delay_ms_;
    std::atomic<std::uint16_t> listening_port_;
};

}
