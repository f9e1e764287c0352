#include "photolink/transfer/photo_receiver.hpp"
#include "photolink/core/config.hpp"
#include "photolink/core/logger.hpp"
#include <boost/system/system_error.hpp>
#include <algorithm>

namespace photolink::transfer {

using namespace photolink::network;
using std::chrono::milliseconds;

ReceiverOptions ReceiverOptions::from_config(const core::Config& config) {
    ReceiverOptions options;
    options.inactivity_timeout = config.get_duration_ms("receiver.inactivity_timeout_ms", options.inactivity_timeout);
    options.recovery_timeout = config.get_duration_ms("receiver.recovery_timeout_ms", options.recovery_timeout);
    return options;
}

PhotoReceiver::PhotoReceiver(boost::asio::io_context& io_context, PacketWriter& writer, ReceiverOptions options)
    : writer_(writer)
    , options_(options)
    , inactivity_timer_(io_context)
    , recovery_timer_(io_context)
    , session_id_(0) {
}

void PhotoReceiver::handle_packet(std::span<const std::uint8_t> packet) {
    try {
        switch (packet_kind_of(packet)) {
            case PacketKind::START:
                on_start(decode_start(packet));
                break;
            case PacketKind::DATA:
                on_data(decode_data(packet));
                break;
            case PacketKind::END:
                on_end(decode_end(packet));
                break;
            case PacketKind::ACK:
            case PacketKind::RETRY:
                LOG_DEBUG("Receiver ignoring {} packet", packet_kind_name(packet[0]));
                break;
        }
    } catch (const ProtocolException& e) {
        LOG_WARN("Dropping malformed packet: {}", e.what());
    }
}

void PhotoReceiver::reset() {
    if (session_) {
        LOG_INFO("Receiver reset, dropping {} buffered chunks", session_->chunks.stored_count());
    }
    clear_session();
    state_.set(Idle{});
}

void PhotoReceiver::cancel() {
    if (session_) {
        finish_with_error("cancelled", std::nullopt);
    }
}

void PhotoReceiver::abort(const std::string& reason) {
    if (session_) {
        finish_with_error(reason, std::nullopt);
    }
}

void PhotoReceiver::on_start(const StartPacket& start) {
    if (start.total_size == 0 || start.total_size > MAX_PHOTO_SIZE ||
        start.total_chunks == 0 || start.total_chunks > MAX_CHUNKS) {
        LOG_WARN("Rejecting START: {} bytes in {} chunks is out of bounds", start.total_size, start.total_chunks);
        send(encode_ack(0, StatusCode::GENERIC_ERROR));
        return;
    }

    if (session_) {
        LOG_WARN("New START while receiving, discarding {} of {} chunks",
                 session_->chunks.stored_count(), session_->total_chunks);
        clear_session();
    }

    session_.emplace(Session{
        start.total_size,
        start.total_chunks,
        start.md5,
        storage::ChunkArena(start.total_chunks),
        std::chrono::steady_clock::now(),
        false
    });
    ++session_id_;

    LOG_INFO("Receiving photo: {} bytes in {} chunks, md5 {}",
             start.total_size, start.total_chunks, crypto::to_hex(start.md5));

    state_.set(InProgress{0, start.total_chunks, 0, start.total_size});
    arm_inactivity_timer();
    send(encode_ack(0, StatusCode::SUCCESS));
}

void PhotoReceiver::on_data(DataPacket data) {
    if (!session_) {
        LOG_DEBUG("DATA for chunk {} without an active session, dropped", data.chunk_index);
        return;
    }

    if (data.chunk_index >= session_->total_chunks) {
        LOG_WARN("Chunk index {} outside [0, {})", data.chunk_index, session_->total_chunks);
        send(encode_ack(data.chunk_index, StatusCode::GENERIC_ERROR));
        return;
    }

    if (!data.is_valid) {
        LOG_WARN("CRC mismatch on chunk {}: expected {:08x}, got {:08x}",
                 data.chunk_index, data.expected_crc, data.actual_crc);
        send(encode_retry(data.chunk_index));
        return;
    }

    // Every chunk but the last is full; the last carries the remainder.
    std::uint64_t offset = static_cast<std::uint64_t>(data.chunk_index) * CHUNK_SIZE;
    std::uint64_t expected = offset < session_->total_size
        ? std::min<std::uint64_t>(CHUNK_SIZE, session_->total_size - offset)
        : 0;
    if (expected == 0 || data.payload.size() != expected) {
        LOG_WARN("Chunk {} carries {} bytes, expected {}", data.chunk_index, data.payload.size(), expected);
        send(encode_ack(data.chunk_index, StatusCode::GENERIC_ERROR));
        return;
    }

    auto index = data.chunk_index;
    session_->chunks.store(index, std::move(data.payload));

    LOG_DEBUG("Stored chunk {} ({}/{})", index, session_->chunks.stored_count(), session_->total_chunks);
    state_.set(InProgress{
        session_->chunks.stored_count(),
        session_->total_chunks,
        session_->chunks.stored_bytes(),
        session_->total_size
    });

    arm_inactivity_timer();
    send(encode_ack(index, StatusCode::SUCCESS));
}

void PhotoReceiver::on_end(const EndPacket& end) {
    if (!session_) {
        LOG_DEBUG("END without an active session, ignored");
        return;
    }

    if (end.status != StatusCode::SUCCESS) {
        finish_with_error("sender reported failure", end.status);
        return;
    }

    auto reassembled = session_->chunks.reassemble();
    if (auto* missing = std::get_if<storage::MissingChunks>(&reassembled)) {
        LOG_WARN("END with {} of {} chunks missing, requesting retransmission",
                 missing->indices.size(), session_->total_chunks);
        for (auto index : missing->indices) {
            send(encode_retry(index));
        }
        if (!session_->recovery_armed) {
            session_->recovery_armed = true;
            arm_recovery_timer();
        }
        return;
    }

    auto payload = std::get<std::vector<std::uint8_t>>(std::move(reassembled));
    if (!crypto::verify_md5(payload, session_->expected_md5)) {
        finish_with_error("md5 mismatch", StatusCode::MD5_ERROR);
        return;
    }

    auto elapsed = std::chrono::duration_cast<milliseconds>(
        std::chrono::steady_clock::now() - session_->started_at).count();

    ReceivedPhoto photo{payload, std::chrono::system_clock::now(), static_cast<std::uint64_t>(elapsed)};
    clear_session();

    LOG_INFO("Photo received: {} bytes in {} ms", payload.size(), elapsed);
    state_.set(Success{std::move(payload)});

    if (photo_handler_) {
        photo_handler_(std::move(photo));
    }
}

void PhotoReceiver::arm_inactivity_timer() {
    inactivity_timer_.expires_after(options_.inactivity_timeout);
    inactivity_timer_.async_wait([weak = weak_from_this(), id = session_id_](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            self->on_timer(id, "timeout");
        }
    });
}

void PhotoReceiver::arm_recovery_timer() {
    recovery_timer_.expires_after(options_.recovery_timeout);
    recovery_timer_.async_wait([weak = weak_from_this(), id = session_id_](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            self->on_timer(id, "missing chunks not recovered");
        }
    });
}

void PhotoReceiver::on_timer(std::uint64_t session_id, const std::string& message) {
    if (!session_ || session_id != session_id_) {
        return;
    }
    finish_with_error(message, StatusCode::TIMEOUT);
}

void PhotoReceiver::finish_with_error(const std::string& message, std::optional<StatusCode> status) {
    LOG_ERROR("Photo receive failed: {}", message);
    clear_session();
    state_.set(Error{message, status});
}

void PhotoReceiver::clear_session() {
    inactivity_timer_.cancel();
    recovery_timer_.cancel();
    session_.reset();
    ++session_id_;
}

void PhotoReceiver::send(const std::vector<std::uint8_t>& packet) {
    try {
        writer_.write_packet(packet);
    } catch (const boost::system::system_error& e) {
        LOG_WARN("Failed to send {}: {}", packet_kind_name(packet[0]), e.what());
    }
}

}
