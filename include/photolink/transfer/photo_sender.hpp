#pragma once

#include "photolink/core/observable.hpp"
#include "photolink/network/packet_writer.hpp"
#include "photolink/network/photo_protocol.hpp"
#include "photolink/transfer/transfer_state.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace photolink::core {
    class Config;
}

namespace photolink::transfer {

struct SenderOptions {
    std::uint32_t chunk_size = network::CHUNK_SIZE;
    int max_retry_count = network::MAX_RETRY_COUNT;
    std::chrono::milliseconds chunk_delay{network::CHUNK_DELAY_MS};
    std::chrono::milliseconds retry_delay{100};
    std::chrono::milliseconds ack_timeout{network::ACK_TIMEOUT_MS};
    std::chrono::milliseconds transfer_timeout{network::SENDER_TRANSFER_TIMEOUT_MS};

    static SenderOptions from_config(const core::Config& config);
};

enum class SenderPhase {
    IDLE,
    COMPUTING_METADATA,
    SENDING_START,
    SENDING_CHUNKS,
    SENDING_END,
    SUCCESS,
    ERROR
};

// One outbound photo. send() runs on the caller's thread; ACK and RETRY
// packets arrive through handle_packet() from the connection's io thread.
class PhotoSender {
public:
    using ProgressCallback = std::function<void(std::uint32_t current_chunk, std::uint32_t total_chunks)>;

    explicit PhotoSender(network::PacketWriter& writer, SenderOptions options = {});

    PhotoSender(const PhotoSender&) = delete;
    PhotoSender& operator=(const PhotoSender&) = delete;

    TransferResult send(std::span<const std::uint8_t> photo);

    void cancel();
    void handle_packet(std::span<const std::uint8_t> packet);
    void notify_connection_lost();

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    core::Observable<TransferState>& state() { return state_; }
    const core::Observable<TransferState>& state() const { return state_; }

    SenderPhase phase() const;
    std::uint32_t retry_count() const;

private:
    bool send_chunk(std::uint32_t index, std::span<const std::uint8_t> chunk);
    bool resend_requested(const std::vector<std::span<const std::uint8_t>>& chunks);
    std::optional<TransferResult> await_completion(const std::vector<std::span<const std::uint8_t>>& chunks);

    bool aborted_locked() const { return cancelled_ || connection_lost_ || rejected_; }
    std::optional<TransferResult> check_abort();
    void sleep_for(std::chrono::milliseconds delay);
    void set_phase(SenderPhase phase);
    void publish_progress(const InProgress& progress);

    TransferResult fail(TransferError error, const std::string& message,
                        std::optional<network::StatusCode> status = std::nullopt);

    network::PacketWriter& writer_;
    SenderOptions options_;
    core::Observable<TransferState> state_;
    ProgressCallback progress_callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SenderPhase phase_;
    bool terminal_;
    bool cancelled_;
    bool connection_lost_;
    bool rejected_;
    bool start_acked_;
    std::uint32_t total_chunks_;
    std::vector<bool> acked_;
    std::uint32_t acked_count_;
    std::deque<std::uint32_t> pending_retries_;
    std::uint32_t retry_count_;
    std::chrono::steady_clock::time_point deadline_;
};

}
