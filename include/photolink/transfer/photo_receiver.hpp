#pragma once

#include "photolink/core/observable.hpp"
#include "photolink/crypto/hash.hpp"
#include "photolink/network/packet_writer.hpp"
#include "photolink/network/photo_protocol.hpp"
#include "photolink/storage/chunk_planner.hpp"
#include "photolink/transfer/transfer_state.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace photolink::core {
    class Config;
}

namespace photolink::transfer {

struct ReceivedPhoto {
    std::vector<std::uint8_t> payload;
    std::chrono::system_clock::time_point received_at;
    std::uint64_t transfer_time_ms;
};

struct ReceiverOptions {
    std::chrono::milliseconds inactivity_timeout{network::RECEIVER_TRANSFER_TIMEOUT_MS};
    std::chrono::milliseconds recovery_timeout{10000};

    static ReceiverOptions from_config(const core::Config& config);
};

// Inbound side: at most one active session, reassembled in a chunk arena.
// Every member function must run on the io_context's thread; timers capture
// a weak reference, so instances are owned by std::shared_ptr.
class PhotoReceiver : public std::enable_shared_from_this<PhotoReceiver> {
public:
    using PhotoHandler = std::function<void(ReceivedPhoto)>;

    PhotoReceiver(boost::asio::io_context& io_context, network::PacketWriter& writer,
                  ReceiverOptions options = {});

    PhotoReceiver(const PhotoReceiver&) = delete;
    PhotoReceiver& operator=(const PhotoReceiver&) = delete;

    void handle_packet(std::span<const std::uint8_t> packet);

    // Back to Idle without reporting anything.
    void reset();
    // Ends an active session with Error("cancelled").
    void cancel();
    // Ends an active session with Error(reason); used on connection loss.
    void abort(const std::string& reason);

    bool is_active() const { return session_.has_value(); }
    std::uint32_t stored_chunks() const { return session_ ? session_->chunks.stored_count() : 0; }

    void set_photo_handler(PhotoHandler handler) { photo_handler_ = std::move(handler); }

    core::Observable<TransferState>& state() { return state_; }
    const core::Observable<TransferState>& state() const { return state_; }

private:
    struct Session {
        std::uint32_t total_size;
        std::uint32_t total_chunks;
        crypto::Md5Digest expected_md5;
        storage::ChunkArena chunks;
        std::chrono::steady_clock::time_point started_at;
        bool recovery_armed;
    };

    void on_start(const network::StartPacket& start);
    void on_data(network::DataPacket data);
    void on_end(const network::EndPacket& end);

    void arm_inactivity_timer();
    void arm_recovery_timer();
    void on_timer(std::uint64_t session_id, const std::string& message);

    void finish_with_error(const std::string& message, std::optional<network::StatusCode> status);
    void clear_session();
    void send(const std::vector<std::uint8_t>& packet);

    network::PacketWriter& writer_;
    ReceiverOptions options_;
    boost::asio::steady_timer inactivity_timer_;
    boost::asio::steady_timer recovery_timer_;
    core::Observable<TransferState> state_;
    PhotoHandler photo_handler_;

    std::optional<Session> session_;
    std::uint64_t session_id_;
};

}
