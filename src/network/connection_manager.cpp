#include "photolink/network/connection_manager.hpp"
#include "photolink/network/frame_parser.hpp"
#include "photolink/core/config.hpp"
#include "photolink/core/logger.hpp"
#include <algorithm>
#include <array>
#include <future>

namespace photolink::network {

namespace {
    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    bool is_busy(const ConnectionState& state) {
        return std::holds_alternative<Connecting>(state) || std::holds_alternative<Connected>(state);
    }
}

std::string describe(const ConnectionState& state) {
    return std::visit(overloaded{
        [](const Disconnected&) { return std::string("Disconnected"); },
        [](const Connecting&) { return std::string("Connecting"); },
        [](const Connected& connected) { return "Connected(" + connected.peer_id + ")"; },
        [](const Failed& failed) { return "Failed(" + failed.reason + ")"; }
    }, state);
}

std::chrono::milliseconds ConnectionOptions::connect_delay(int attempt) const {
    return std::min(connect_base_delay + connect_step_delay * attempt, connect_max_delay);
}

std::chrono::milliseconds ConnectionOptions::reconnect_delay(int failed_cycles) const {
    auto delay = reconnect_initial_delay;
    for (int i = 0; i < failed_cycles && delay < reconnect_max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, reconnect_max_delay);
}

ConnectionOptions ConnectionOptions::from_config(const core::Config& config) {
    ConnectionOptions options;
    options.device_name = config.get_string("device.name", options.device_name);
    options.max_retries = config.get_int("connect.max_retries", options.max_retries);
    options.connect_base_delay = config.get_duration_ms("connect.base_delay_ms", options.connect_base_delay);
    options.connect_step_delay = config.get_duration_ms("connect.step_delay_ms", options.connect_step_delay);
    options.connect_max_delay = config.get_duration_ms("connect.max_delay_ms", options.connect_max_delay);
    options.heartbeat_interval = config.get_duration_ms("heartbeat.interval_ms", options.heartbeat_interval);
    options.max_missed_heartbeats = config.get_int("heartbeat.max_missed", options.max_missed_heartbeats);
    options.reconnect_initial_delay = config.get_duration_ms("reconnect.initial_delay_ms", options.reconnect_initial_delay);
    options.reconnect_max_delay = config.get_duration_ms("reconnect.max_delay_ms", options.reconnect_max_delay);
    return options;
}

ConnectionManager::ConnectionManager(ConnectionOptions options,
                                     std::vector<std::shared_ptr<ChannelStrategy>> strategies)
    : options_(std::move(options))
    , strategies_(std::move(strategies))
    , io_context_()
    , work_guard_(boost::asio::make_work_guard(io_context_))
    , running_(true)
    , generation_(0)
    , heartbeat_timer_(io_context_)
    , reconnect_timer_(io_context_)
    , failed_reconnect_cycles_(0)
    , connect_epoch_(0)
    , missed_heartbeats_(0)
    , scheduled_reconnects_(0)
    , last_reconnect_delay_ms_(0)
    , listening_port_(0) {

    io_thread_ = std::thread([this]() {
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("IO context error: {}", e.what());
                if (!running_) break;
                io_context_.restart();
            }
        }
    });
}

ConnectionManager::~ConnectionManager() {
    disconnect();

    running_ = false;
    work_guard_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    // Workers touch this object until their blocking open() returns.
    for (auto& worker : connect_workers_) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

bool ConnectionManager::connect(const PeerAddress& peer, int max_retries) {
    if (max_retries < 1) {
        LOG_WARN("Connect to {} needs at least one attempt", peer.peer_id());
        return false;
    }

    bool started = false;
    run_on_io([&]() {
        auto current = state_.get();
        if (is_busy(current)) {
            LOG_WARN("Connect to {} refused while {}", peer.peer_id(), describe(current));
            return;
        }

        reconnect_timer_.cancel();
        last_peer_ = peer;
        failed_reconnect_cycles_ = 0;
        start_connect(peer, max_retries, false);
        started = true;
    });
    return started;
}

bool ConnectionManager::listen(std::uint16_t port) {
    bool started = false;
    run_on_io([&]() {
        auto current = state_.get();
        if (is_busy(current)) {
            LOG_WARN("Listen refused while {}", describe(current));
            return;
        }

        try {
            auto acceptor = std::make_unique<tcp::acceptor>(io_context_);
            tcp::endpoint endpoint(tcp::v4(), port);
            acceptor->open(endpoint.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(endpoint);
            acceptor->listen(1);
            listening_port_ = acceptor->local_endpoint().port();
            acceptor_ = std::move(acceptor);
        } catch (const boost::system::system_error& e) {
            LOG_ERROR("Failed to listen on port {}: {}", port, e.what());
            state_.set(Failed{e.what()});
            return;
        }

        LOG_INFO("Waiting for peer on port {}", listening_port_.load());
        state_.set(Connecting{});

        acceptor_->async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG_ERROR("Accept failed: {}", ec.message());
                    acceptor_.reset();
                    state_.set(Failed{ec.message()});
                }
                return;
            }

            acceptor_.reset();
            auto stream = std::make_unique<TcpByteStream>(std::move(socket));
            auto peer_id = stream->describe();
            adopt_stream(std::move(stream), peer_id, false);
        });
        started = true;
    });
    return started;
}

bool ConnectionManager::attach(std::unique_ptr<ByteStream> stream, const std::string& peer_id) {
    bool attached = false;
    run_on_io([&]() {
        auto current = state_.get();
        if (is_busy(current)) {
            LOG_WARN("Attach of {} refused while {}", peer_id, describe(current));
            return;
        }
        adopt_stream(std::move(stream), peer_id, false);
        attached = true;
    });
    return attached;
}

bool ConnectionManager::attach(std::unique_ptr<ByteStream> stream, const PeerAddress& peer) {
    bool attached = false;
    run_on_io([&]() {
        auto current = state_.get();
        if (is_busy(current)) {
            LOG_WARN("Attach of {} refused while {}", peer.peer_id(), describe(current));
            return;
        }
        reconnect_timer_.cancel();
        last_peer_ = peer;
        failed_reconnect_cycles_ = 0;
        adopt_stream(std::move(stream), peer.peer_id(), true);
        attached = true;
    });
    return attached;
}

void ConnectionManager::disconnect() {
    run_on_io([this]() {
        // A worker stuck in open() is left to finish on its own; its result is discarded.
        cancel_connect_attempts();
        reconnect_timer_.cancel();

        if (acceptor_) {
            boost::system::error_code ec;
            acceptor_->close(ec);
            acceptor_.reset();
        }

        last_peer_.reset();
        failed_reconnect_cycles_ = 0;
        teardown(Disconnected{}, false);
    });
}

void ConnectionManager::write_packet(std::span<const std::uint8_t> packet) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!stream_) {
        throw boost::system::system_error(boost::asio::error::not_connected, "no active link");
    }

    try {
        stream_->write_all(packet);
        stream_->flush();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Write to {} failed: {}", stream_->describe(), e.what());
        boost::asio::post(io_context_, [this, generation = generation_.load(), reason = std::string(e.what())]() {
            on_stream_ended(generation, reason);
        });
        throw;
    }
}

bool ConnectionManager::send_message(const ControlMessage& message) {
    auto line = message.serialize();
    LOG_DEBUG("Sending {} ({})", control_type_name(message.type), message.id);
    return write_bytes(std::span(reinterpret_cast<const std::uint8_t*>(line.data()), line.size()));
}

bool ConnectionManager::is_connected() const {
    return std::holds_alternative<Connected>(state_.get());
}

bool ConnectionManager::wait_for_connection(std::chrono::milliseconds timeout) const {
    bool settled = state_.wait_for([](const ConnectionState& state) {
        return std::holds_alternative<Connected>(state) || std::holds_alternative<Failed>(state);
    }, timeout);
    return settled && is_connected();
}

void ConnectionManager::set_packet_handler(PacketHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    packet_handler_ = std::move(handler);
}

void ConnectionManager::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    message_handler_ = std::move(handler);
}

void ConnectionManager::run_on_io(const std::function<void()>& fn) {
    if (io_context_.get_executor().running_in_this_thread()) {
        fn();
        return;
    }

    std::promise<void> done;
    auto future = done.get_future();
    boost::asio::post(io_context_, [&fn, &done]() {
        try {
            fn();
            done.set_value();
        } catch (...) {
            done.set_exception(std::current_exception());
        }
    });
    future.get();
}

std::chrono::milliseconds ConnectionManager::last_reconnect_delay() const {
    return std::chrono::milliseconds(last_reconnect_delay_ms_.load());
}

void ConnectionManager::start_connect(const PeerAddress& peer, int max_retries, bool reconnecting) {
    reap_connect_workers();
    auto epoch = cancel_connect_attempts();

    state_.set(Connecting{});

    ConnectWorker worker;
    worker.finished = std::make_shared<std::atomic<bool>>(false);
    worker.thread = std::thread([this, peer, max_retries, reconnecting, epoch, finished = worker.finished]() {
        run_connect_attempts(epoch, peer, max_retries, reconnecting);
        *finished = true;
    });
    connect_workers_.push_back(std::move(worker));
}

std::uint64_t ConnectionManager::cancel_connect_attempts() {
    std::uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        epoch = ++connect_epoch_;
    }
    connect_cv_.notify_all();
    return epoch;
}

bool ConnectionManager::connect_cancelled(std::uint64_t epoch) {
    std::lock_guard<std::mutex> lock(connect_mutex_);
    return epoch != connect_epoch_;
}

void ConnectionManager::reap_connect_workers() {
    auto finished = std::partition(connect_workers_.begin(), connect_workers_.end(), [](const ConnectWorker& worker) {
        return !*worker.finished;
    });
    for (auto it = finished; it != connect_workers_.end(); ++it) {
        it->thread.join();
    }
    connect_workers_.erase(finished, connect_workers_.end());
}

void ConnectionManager::run_connect_attempts(std::uint64_t epoch, PeerAddress peer, int max_retries, bool reconnecting) {
    std::string last_error = "no attempt made";

    for (int attempt = 1; attempt <= max_retries; ++attempt) {
        if (connect_cancelled(epoch)) {
            last_error = "cancelled";
            break;
        }

        try {
            auto strategy = select_strategy(strategies_, attempt);
            LOG_INFO("Connecting to {} (attempt {}/{}, {})", peer.peer_id(), attempt, max_retries, strategy->name());

            auto holder = std::make_shared<std::unique_ptr<ByteStream>>(strategy->open(io_context_, peer));
            boost::asio::post(io_context_, [this, holder, epoch, peer_id = peer.peer_id()]() {
                if (connect_cancelled(epoch)) {
                    LOG_INFO("Discarding link to {} opened after cancellation", peer_id);
                    (*holder)->close();
                    return;
                }
                adopt_stream(std::move(*holder), peer_id, true);
            });
            return;
        } catch (const std::exception& e) {
            last_error = e.what();
            LOG_WARN("Connection attempt {} to {} failed: {}", attempt, peer.peer_id(), last_error);
        }

        if (attempt < max_retries && !wait_connect_delay(epoch, options_.connect_delay(attempt))) {
            last_error = "cancelled";
            break;
        }
    }

    boost::asio::post(io_context_, [this, epoch, last_error, reconnecting]() {
        on_connect_failed(epoch, last_error, reconnecting);
    });
}

bool ConnectionManager::wait_connect_delay(std::uint64_t epoch, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(connect_mutex_);
    return !connect_cv_.wait_for(lock, delay, [this, epoch]() { return epoch != connect_epoch_; });
}

void ConnectionManager::adopt_stream(std::unique_ptr<ByteStream> stream, const std::string& peer_id, bool outbound) {
    if (stream_) {
        LOG_WARN("Already linked, closing new stream from {}", peer_id);
        stream->close();
        return;
    }

    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        stream_ = std::move(stream);
    }

    auto generation = ++generation_;
    missed_heartbeats_ = 0;
    failed_reconnect_cycles_ = 0;

    ByteStream* raw = stream_.get();
    reader_thread_ = std::thread(&ConnectionManager::read_loop, this, raw, generation);

    LOG_INFO("Connected to {} via {}", peer_id, raw->describe());
    state_.set(Connected{peer_id});
    arm_heartbeat();

    if (outbound && options_.send_handshake) {
        send_message(ControlMessage::create(ControlType::HANDSHAKE, options_.device_name));
    }
}

void ConnectionManager::on_connect_failed(std::uint64_t epoch, const std::string& reason, bool reconnecting) {
    if (connect_cancelled(epoch)) {
        return;
    }

    LOG_ERROR("Failed to connect: {}", reason);
    state_.set(Failed{reason});

    if (reconnecting && last_peer_) {
        ++failed_reconnect_cycles_;
        schedule_reconnect();
    }
}

void ConnectionManager::teardown(ConnectionState next, bool schedule) {
    heartbeat_timer_.cancel();
    ++generation_;
    missed_heartbeats_ = 0;

    if (stream_) {
        stream_->shutdown();
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }

    bool had_link = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (stream_) {
            stream_->close();
            stream_.reset();
            had_link = true;
        }
    }

    if (had_link) {
        LOG_INFO("Link closed, now {}", describe(next));
    }

    if (!std::holds_alternative<Disconnected>(state_.get()) || !std::holds_alternative<Disconnected>(next)) {
        state_.set(std::move(next));
    }

    if (schedule && last_peer_) {
        schedule_reconnect();
    }
}

void ConnectionManager::schedule_reconnect() {
    auto delay = options_.reconnect_delay(failed_reconnect_cycles_);
    ++scheduled_reconnects_;
    last_reconnect_delay_ms_ = delay.count();

    LOG_INFO("Reconnecting to {} in {} ms", last_peer_->peer_id(), delay.count());

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !last_peer_) {
            return;
        }
        if (is_busy(state_.get())) {
            return;
        }
        start_connect(*last_peer_, options_.max_retries, true);
    });
}

void ConnectionManager::read_loop(ByteStream* stream, std::uint64_t generation) {
    FrameParser parser;
    std::array<std::uint8_t, 4096> buffer;
    std::string reason = "end of stream";

    try {
        while (true) {
            auto n = stream->read_some(buffer);
            if (n == 0) {
                break;
            }

            for (auto& frame : parser.feed(std::span<const std::uint8_t>(buffer.data(), n))) {
                if (auto* packet = std::get_if<BinaryFrame>(&frame)) {
                    boost::asio::post(io_context_, [this, generation, bytes = std::move(packet->bytes)]() mutable {
                        dispatch_packet(generation, std::move(bytes));
                    });
                } else {
                    boost::asio::post(io_context_, [this, generation, message = std::get<ControlMessage>(frame)]() {
                        dispatch_message(generation, message);
                    });
                }
            }
        }
    } catch (const std::exception& e) {
        reason = e.what();
    }

    boost::asio::post(io_context_, [this, generation, reason]() {
        on_stream_ended(generation, reason);
    });
}

void ConnectionManager::on_stream_ended(std::uint64_t generation, const std::string& reason) {
    if (generation != generation_ || !stream_) {
        return;
    }

    LOG_WARN("Link lost: {}", reason);
    teardown(Disconnected{}, false);
}

void ConnectionManager::dispatch_packet(std::uint64_t generation, std::vector<std::uint8_t> packet) {
    if (generation != generation_) {
        return;
    }

    PacketHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = packet_handler_;
    }

    if (!handler) {
        LOG_DEBUG("No packet handler, dropping {}", packet_kind_name(packet[0]));
        return;
    }

    try {
        handler(std::move(packet));
    } catch (const std::exception& e) {
        LOG_ERROR("Packet handler failed: {}", e.what());
    }
}

void ConnectionManager::dispatch_message(std::uint64_t generation, const ControlMessage& message) {
    if (generation != generation_) {
        return;
    }

    switch (message.type) {
        case ControlType::HEARTBEAT:
            send_message(ControlMessage::create(ControlType::HEARTBEAT_ACK));
            return;
        case ControlType::HEARTBEAT_ACK:
            missed_heartbeats_ = 0;
            return;
        case ControlType::HANDSHAKE:
            LOG_INFO("Handshake from '{}'", message.payload.value_or("unnamed"));
            send_message(ControlMessage::create(ControlType::HANDSHAKE_ACK, options_.device_name));
            break;
        default:
            break;
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = message_handler_;
    }

    if (handler) {
        try {
            handler(message);
        } catch (const std::exception& e) {
            LOG_ERROR("Message handler failed: {}", e.what());
        }
    }

    if (message.type == ControlType::DISCONNECT) {
        LOG_INFO("Peer requested disconnect");
        teardown(Disconnected{}, false);
    }
}

void ConnectionManager::arm_heartbeat() {
    heartbeat_timer_.expires_after(options_.heartbeat_interval);
    heartbeat_timer_.async_wait([this, generation = generation_.load()](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        on_heartbeat_tick(generation);
    });
}

void ConnectionManager::on_heartbeat_tick(std::uint64_t generation) {
    if (generation != generation_ || !stream_) {
        return;
    }

    ++missed_heartbeats_;
    LOG_DEBUG("Heartbeat ({} outstanding)", missed_heartbeats_.load());
    send_message(ControlMessage::create(ControlType::HEARTBEAT));

    if (missed_heartbeats_ >= options_.max_missed_heartbeats) {
        LOG_WARN("{} heartbeats unanswered, declaring link dead", missed_heartbeats_.load());
        teardown(Disconnected{}, true);
        return;
    }
    arm_heartbeat();
}

bool ConnectionManager::write_bytes(std::span<const std::uint8_t> data) {
    try {
        write_packet(data);
        return true;
    } catch (const boost::system::system_error& e) {
        LOG_WARN("Control write failed: {}", e.what());
        return false;
    }
}

}
