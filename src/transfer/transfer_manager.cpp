#include "photolink/transfer/transfer_manager.hpp"
#include "photolink/core/logger.hpp"

namespace photolink::transfer {

using namespace photolink::network;

TransferManager::TransferManager(ConnectionManager& connection,
                                 SenderOptions sender_options,
                                 ReceiverOptions receiver_options)
    : connection_(connection)
    , sender_options_(sender_options)
    , receiver_(std::make_shared<PhotoReceiver>(connection.io_context(), connection, receiver_options)) {

    connection_.set_packet_handler([this](std::vector<std::uint8_t> packet) {
        on_packet(std::move(packet));
    });
    connection_.set_state_handler([this](const ConnectionState& state) {
        on_connection_state(state);
    });
}

TransferManager::~TransferManager() {
    connection_.set_packet_handler(nullptr);
    connection_.set_state_handler(nullptr);
    cancel_transfer();

    // Timers belong to the io thread, so the receiver is released there.
    connection_.run_on_io([this]() { receiver_.reset(); });
}

TransferResult TransferManager::send_photo(std::span<const std::uint8_t> photo) {
    if (!connection_.is_connected()) {
        outbound_state_.set(Error{"not connected", std::nullopt});
        return TransferResult(TransferError::NOT_CONNECTED, "not connected");
    }

    auto sender = std::make_shared<PhotoSender>(connection_, sender_options_);
    // Forwarding is in place before the sender becomes visible to cancel_transfer().
    sender->state().set_change_handler([this](const TransferState& state) {
        outbound_state_.set(state);
    });
    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        if (active_sender_) {
            return TransferResult(TransferError::INVALID_STATE, "a transfer is already in progress");
        }
        active_sender_ = sender;
        sender->set_progress_callback(progress_callback_);
    }

    auto result = sender->send(photo);

    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        active_sender_.reset();
    }

    // Handlers racing across threads may have forwarded out of order; the sender's final state wins.
    outbound_state_.set(sender->state().get());
    return result;
}

void TransferManager::cancel_transfer() {
    if (auto sender = current_sender()) {
        sender->cancel();
    }

    connection_.run_on_io([this]() {
        if (receiver_) {
            receiver_->cancel();
        }
    });
}

void TransferManager::reset() {
    connection_.run_on_io([this]() {
        if (receiver_) {
            receiver_->reset();
        }
    });

    if (!has_active_send()) {
        outbound_state_.set(Idle{});
    }
}

void TransferManager::set_photo_handler(PhotoReceiver::PhotoHandler handler) {
    connection_.run_on_io([this, &handler]() {
        receiver_->set_photo_handler(std::move(handler));
    });
}

void TransferManager::set_progress_callback(PhotoSender::ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(sender_mutex_);
    progress_callback_ = std::move(callback);
}

std::shared_ptr<PhotoSender> TransferManager::current_sender() const {
    std::lock_guard<std::mutex> lock(sender_mutex_);
    return active_sender_;
}

bool TransferManager::has_active_send() const {
    std::lock_guard<std::mutex> lock(sender_mutex_);
    return active_sender_ != nullptr;
}

void TransferManager::on_packet(std::vector<std::uint8_t> packet) {
    if (packet.empty() || !receiver_) {
        return;
    }

    auto kind = static_cast<PacketKind>(packet[0]);
    if (kind == PacketKind::ACK || kind == PacketKind::RETRY) {
        if (auto sender = current_sender()) {
            sender->handle_packet(packet);
        } else {
            LOG_DEBUG("{} with no outbound transfer, dropped", packet_kind_name(packet[0]));
        }
        return;
    }

    receiver_->handle_packet(packet);
}

void TransferManager::on_connection_state(const ConnectionState& state) {
    if (std::holds_alternative<Connected>(state) || std::holds_alternative<Connecting>(state)) {
        return;
    }

    if (auto sender = current_sender()) {
        sender->notify_connection_lost();
    }

    if (receiver_) {
        receiver_->abort("connection lost");
    }
}

}
