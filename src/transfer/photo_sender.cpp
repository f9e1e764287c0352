#include "photolink/transfer/photo_sender.hpp"
#include "photolink/core/config.hpp"
#include "photolink/core/logger.hpp"
#include "photolink/crypto/hash.hpp"
#include "photolink/storage/chunk_planner.hpp"
#include <boost/system/system_error.hpp>
#include <algorithm>

namespace photolink::transfer {

using namespace photolink::network;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

SenderOptions SenderOptions::from_config(const core::Config& config) {
    SenderOptions options;
    options.chunk_delay = config.get_duration_ms("transfer.chunk_delay_ms", options.chunk_delay);
    options.retry_delay = config.get_duration_ms("transfer.retry_delay_ms", options.retry_delay);
    options.ack_timeout = config.get_duration_ms("transfer.ack_timeout_ms", options.ack_timeout);
    options.transfer_timeout = config.get_duration_ms("transfer.timeout_ms", options.transfer_timeout);
    return options;
}

PhotoSender::PhotoSender(PacketWriter& writer, SenderOptions options)
    : writer_(writer)
    , options_(options)
    , phase_(SenderPhase::IDLE)
    , terminal_(false)
    , cancelled_(false)
    , connection_lost_(false)
    , rejected_(false)
    , start_acked_(false)
    , total_chunks_(0)
    , acked_count_(0)
    , retry_count_(0) {
}

TransferResult PhotoSender::send(std::span<const std::uint8_t> photo) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return TransferResult(TransferError::CANCELLED, "cancelled");
        }
        if (phase_ != SenderPhase::IDLE) {
            return TransferResult(TransferError::INVALID_STATE, "sender already used");
        }
        phase_ = SenderPhase::COMPUTING_METADATA;
        deadline_ = steady_clock::now() + options_.transfer_timeout;
    }

    auto started = steady_clock::now();

    if (photo.empty()) {
        return fail(TransferError::INVALID_PAYLOAD, "empty payload");
    }
    if (photo.size() > MAX_PHOTO_SIZE) {
        return fail(TransferError::INVALID_PAYLOAD,
            "payload of " + std::to_string(photo.size()) + " bytes exceeds " + std::to_string(MAX_PHOTO_SIZE));
    }

    auto total_chunks = storage::chunk_count_for(photo.size(), options_.chunk_size);
    if (total_chunks > MAX_CHUNKS) {
        return fail(TransferError::INVALID_PAYLOAD,
            "payload needs " + std::to_string(total_chunks) + " chunks, limit is " + std::to_string(MAX_CHUNKS));
    }

    auto md5 = crypto::compute_md5(photo);
    auto chunks = storage::split(photo, options_.chunk_size);
    auto total_size = static_cast<std::uint32_t>(photo.size());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        total_chunks_ = total_chunks;
        acked_.assign(total_chunks, false);
    }

    LOG_INFO("Sending photo: {} bytes in {} chunks, md5 {}", total_size, total_chunks, crypto::to_hex(md5));

    set_phase(SenderPhase::SENDING_START);
    publish_progress(InProgress{0, total_chunks, 0, total_size});

    try {
        writer_.write_packet(encode_start(total_size, total_chunks, md5));
    } catch (const boost::system::system_error& e) {
        return fail(TransferError::TRANSPORT_FAILURE, std::string("failed to send START: ") + e.what());
    }

    set_phase(SenderPhase::SENDING_CHUNKS);

    std::uint64_t bytes_sent = 0;
    for (std::uint32_t i = 0; i < total_chunks; ++i) {
        if (auto aborted = check_abort()) {
            return *aborted;
        }

        if (!send_chunk(i, chunks[i])) {
            if (auto aborted = check_abort()) {
                return *aborted;
            }

            try {
                writer_.write_packet(encode_end(StatusCode::GENERIC_ERROR));
            } catch (const boost::system::system_error& e) {
                LOG_WARN("Could not send END(GENERIC_ERROR): {}", e.what());
            }
            return fail(TransferError::TRANSPORT_FAILURE,
                "chunk " + std::to_string(i) + " failed after " + std::to_string(options_.max_retry_count) + " attempts",
                StatusCode::GENERIC_ERROR);
        }

        bytes_sent += chunks[i].size();
        publish_progress(InProgress{i + 1, total_chunks, bytes_sent, total_size});
        if (progress_callback_) {
            progress_callback_(i + 1, total_chunks);
        }

        if (!resend_requested(chunks)) {
            if (auto aborted = check_abort()) {
                return *aborted;
            }
            return fail(TransferError::TRANSPORT_FAILURE, "failed to resend requested chunk");
        }

        if (i + 1 < total_chunks) {
            sleep_for(options_.chunk_delay);
        }
    }

    set_phase(SenderPhase::SENDING_END);
    try {
        writer_.write_packet(encode_end(StatusCode::SUCCESS));
    } catch (const boost::system::system_error& e) {
        return fail(TransferError::TRANSPORT_FAILURE, std::string("failed to send END: ") + e.what());
    }

    auto elapsed_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<milliseconds>(steady_clock::now() - started).count());

    if (auto failure = await_completion(chunks)) {
        return *failure;
    }

    TransferStatistics stats{};
    stats.total_bytes = total_size;
    stats.total_chunks = total_chunks;
    stats.elapsed_time_ms = elapsed_ms;
    stats.transfer_rate_kbps = static_cast<double>(total_size) / static_cast<double>(std::max<std::uint64_t>(elapsed_ms, 1))
                               * 1000.0 / 1024.0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminal_) {
            return TransferResult(TransferError::CANCELLED, "cancelled");
        }
        terminal_ = true;
        phase_ = SenderPhase::SUCCESS;
        stats.retry_count = retry_count_;
    }

    LOG_INFO("Photo sent: {} bytes, {} chunks in {} ms ({:.1f} KB/s, {} retries)",
             stats.total_bytes, stats.total_chunks, stats.elapsed_time_ms,
             stats.transfer_rate_kbps, stats.retry_count);

    state_.set(Success{std::vector<std::uint8_t>(photo.begin(), photo.end())});
    return TransferResult::ok(stats);
}

void PhotoSender::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminal_) {
            return;
        }
        cancelled_ = true;
        terminal_ = true;
        phase_ = SenderPhase::ERROR;
    }
    cv_.notify_all();

    LOG_INFO("Photo transfer cancelled");
    state_.set(Error{"cancelled", std::nullopt});
}

void PhotoSender::handle_packet(std::span<const std::uint8_t> packet) {
    try {
        switch (packet_kind_of(packet)) {
            case PacketKind::ACK: {
                auto ack = decode_ack(packet);
                std::lock_guard<std::mutex> lock(mutex_);
                if (phase_ == SenderPhase::IDLE || terminal_) {
                    return;
                }

                if (ack.status != StatusCode::SUCCESS) {
                    if (ack.chunk_index == 0 && !start_acked_) {
                        LOG_WARN("Receiver rejected START ({})", status_name(ack.status));
                        rejected_ = true;
                    } else {
                        LOG_WARN("Receiver reported {} for chunk {}", status_name(ack.status), ack.chunk_index);
                    }
                } else if (ack.chunk_index == 0 && !start_acked_) {
                    start_acked_ = true;
                } else if (ack.chunk_index < total_chunks_ && !acked_[ack.chunk_index]) {
                    acked_[ack.chunk_index] = true;
                    ++acked_count_;
                }
                break;
            }
            case PacketKind::RETRY: {
                auto retry = decode_retry(packet);
                std::lock_guard<std::mutex> lock(mutex_);
                if (phase_ == SenderPhase::IDLE || terminal_ || retry.chunk_index >= total_chunks_) {
                    return;
                }

                LOG_DEBUG("Receiver requested chunk {} again", retry.chunk_index);
                if (acked_[retry.chunk_index]) {
                    acked_[retry.chunk_index] = false;
                    --acked_count_;
                }
                if (std::find(pending_retries_.begin(), pending_retries_.end(), retry.chunk_index) == pending_retries_.end()) {
                    pending_retries_.push_back(retry.chunk_index);
                }
                break;
            }
            default:
                LOG_DEBUG("Sender ignoring {} packet", packet_kind_name(packet[0]));
                return;
        }
    } catch (const ProtocolException& e) {
        LOG_DEBUG("Dropping malformed packet: {}", e.what());
        return;
    }

    cv_.notify_all();
}

void PhotoSender::notify_connection_lost() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == SenderPhase::IDLE || terminal_) {
            return;
        }
        connection_lost_ = true;
    }
    cv_.notify_all();
}

SenderPhase PhotoSender::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

std::uint32_t PhotoSender::retry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_count_;
}

bool PhotoSender::send_chunk(std::uint32_t index, std::span<const std::uint8_t> chunk) {
    auto packet = encode_data(index, chunk, options_.chunk_size);

    for (int attempt = 1; attempt <= options_.max_retry_count; ++attempt) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (aborted_locked()) {
                return false;
            }
            if (attempt > 1) {
                ++retry_count_;
            }
        }

        try {
            writer_.write_packet(packet);
            LOG_DEBUG("Sent chunk {} ({} bytes)", index, chunk.size());
            return true;
        } catch (const boost::system::system_error& e) {
            LOG_WARN("Chunk {} attempt {}/{} failed: {}", index, attempt, options_.max_retry_count, e.what());
        }

        if (attempt < options_.max_retry_count) {
            sleep_for(options_.retry_delay);
        }
    }
    return false;
}

bool PhotoSender::resend_requested(const std::vector<std::span<const std::uint8_t>>& chunks) {
    while (true) {
        std::uint32_t index;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_retries_.empty()) {
                return true;
            }
            index = pending_retries_.front();
            pending_retries_.pop_front();
            ++retry_count_;
        }

        LOG_INFO("Resending chunk {}", index);
        if (!send_chunk(index, chunks[index])) {
            return false;
        }
    }
}

std::optional<TransferResult> PhotoSender::await_completion(const std::vector<std::span<const std::uint8_t>>& chunks) {
    auto window_end = steady_clock::now() + options_.ack_timeout;

    while (true) {
        bool resend = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_until(lock, std::min(window_end, deadline_), [this]() {
                return aborted_locked() || acked_count_ == total_chunks_ || !pending_retries_.empty();
            });

            if (!aborted_locked()) {
                if (acked_count_ == total_chunks_) {
                    LOG_DEBUG("All {} chunks acknowledged", total_chunks_);
                    return std::nullopt;
                }
                resend = !pending_retries_.empty();
            }
        }

        if (auto aborted = check_abort()) {
            return aborted;
        }

        if (resend) {
            if (!resend_requested(chunks)) {
                if (auto aborted = check_abort()) {
                    return aborted;
                }
                return fail(TransferError::TRANSPORT_FAILURE, "failed to resend requested chunk");
            }

            try {
                writer_.write_packet(encode_end(StatusCode::SUCCESS));
            } catch (const boost::system::system_error& e) {
                return fail(TransferError::TRANSPORT_FAILURE, std::string("failed to send END: ") + e.what());
            }
            window_end = steady_clock::now() + options_.ack_timeout;
            continue;
        }

        if (steady_clock::now() >= window_end) {
            LOG_DEBUG("No completion feedback within {} ms, assuming delivered", options_.ack_timeout.count());
            return std::nullopt;
        }
    }
}

std::optional<TransferResult> PhotoSender::check_abort() {
    bool cancelled, lost, rejected, timed_out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled = cancelled_;
        lost = connection_lost_;
        rejected = rejected_;
        timed_out = steady_clock::now() >= deadline_;
    }

    if (cancelled) {
        return TransferResult(TransferError::CANCELLED, "cancelled");
    }
    if (lost) {
        return fail(TransferError::CONNECTION_LOST, "connection lost");
    }
    if (rejected) {
        return fail(TransferError::REJECTED, "rejected by receiver");
    }
    if (timed_out) {
        return fail(TransferError::TIMEOUT, "timeout", StatusCode::TIMEOUT);
    }
    return std::nullopt;
}

void PhotoSender::sleep_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, std::min(steady_clock::now() + delay, deadline_), [this]() { return aborted_locked(); });
}

void PhotoSender::publish_progress(const InProgress& progress) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminal_) {
            return;
        }
    }
    // Published without mutex_ held; a handler may call cancel(). A cancel racing
    // with this call has already stored its final state, which progress never replaces.
    state_.set_unless(progress, [](const TransferState& current) { return is_terminal(current); });
}

void PhotoSender::set_phase(SenderPhase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!terminal_) {
        phase_ = phase;
    }
}

TransferResult PhotoSender::fail(TransferError error, const std::string& message,
                                 std::optional<StatusCode> status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminal_) {
            return TransferResult(cancelled_ ? TransferError::CANCELLED : error, cancelled_ ? "cancelled" : message);
        }
        terminal_ = true;
        phase_ = SenderPhase::ERROR;
    }

    LOG_ERROR("Photo transfer failed: {}", message);
    state_.set(Error{message, status});
    return TransferResult(error, message);
}

}
