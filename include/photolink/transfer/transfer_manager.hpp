#pragma once

#include "photolink/core/observable.hpp"
#include "photolink/network/connection_manager.hpp"
#include "photolink/transfer/photo_receiver.hpp"
#include "photolink/transfer/photo_sender.hpp"
#include "photolink/transfer/transfer_state.hpp"
#include <memory>
#include <mutex>
#include <span>

namespace photolink::transfer {

// Binds photo sessions to a connection: inbound START/DATA/END go to the
// receiver, ACK/RETRY to the active sender, and losing the link aborts both.
class TransferManager {
public:
    explicit TransferManager(network::ConnectionManager& connection,
                             SenderOptions sender_options = {},
                             ReceiverOptions receiver_options = {});
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Blocks until the outbound transfer ends. One outbound transfer at a time.
    TransferResult send_photo(std::span<const std::uint8_t> photo);

    void cancel_transfer();
    void reset();

    void set_photo_handler(PhotoReceiver::PhotoHandler handler);
    void set_progress_callback(PhotoSender::ProgressCallback callback);

    core::Observable<TransferState>& outbound_state() { return outbound_state_; }
    core::Observable<TransferState>& inbound_state() { return receiver_->state(); }

    bool has_active_send() const;

private:
    std::shared_ptr<PhotoSender> current_sender() const;
    void on_packet(std::vector<std::uint8_t> packet);
    void on_connection_state(const network::ConnectionState& state);

    network::ConnectionManager& connection_;
    SenderOptions sender_options_;
    std::shared_ptr<PhotoReceiver> receiver_;
    core::Observable<TransferState> outbound_state_;

    mutable std::mutex sender_mutex_;
    std::shared_ptr<PhotoSender> active_sender_;
    PhotoSender::ProgressCallback progress_callback_;
};

}
