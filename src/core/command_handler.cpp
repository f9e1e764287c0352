#include "photolink/core/command_handler.hpp"
#include "photolink/core/logger.hpp"
#include "photolink/core/config.hpp"
#include "photolink/network/connection_manager.hpp"
#include "photolink/transfer/transfer_manager.hpp"
#include <utility>
#include <boost/asio/signal_set.hpp>
#include <atomic>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <chrono>

namespace photolink::core {

namespace {

std::optional<std::vector<std::uint8_t>> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(file),
                                     std::istreambuf_iterator<char>());
}

}

std::string photo_filename(std::chrono::system_clock::time_point when, int sequence) {
    auto time_t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream oss;
    oss << "photo_" << std::put_time(&local, "%Y%m%d_%H%M%S") << "_" << sequence << ".jpg";
    return oss.str();
}

// SendCommandHandler Implementation
CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path file_path = args[1];
    if (!std::filesystem::exists(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }

    auto photo = read_file(file_path);
    if (!photo) {
        return CommandResult::error("Cannot read file: " + file_path.string());
    }

    try {
        auto& config = Config::instance();
        auto options = network::ConnectionOptions::from_config(config);
        auto peer = network::PeerAddress::from_config(config);

        LOG_INFO("Sending {} ({} bytes) to {}", file_path.string(), photo->size(), peer.peer_id());
        std::cout << "Connecting to " << peer.peer_id() << "...\n";

        network::ConnectionManager connection(options);
        transfer::TransferManager transfers(connection,
                                            transfer::SenderOptions::from_config(config),
                                            transfer::ReceiverOptions::from_config(config));

        connection.connect(peer);

        // Upper bound on every attempt plus the waits between them.
        std::chrono::milliseconds connect_budget{0};
        for (int attempt = 1; attempt <= options.max_retries; ++attempt) {
            connect_budget += options.connect_delay(attempt) + std::chrono::seconds(10);
        }

        if (!connection.wait_for_connection(connect_budget)) {
            auto state = connection.state();
            connection.disconnect();
            return CommandResult::error("Failed to connect: " + network::describe(state));
        }

        std::cout << "Connected. Sending " << file_path.filename().string()
                  << " (" << photo->size() << " bytes)\n";

        transfers.set_progress_callback([](std::uint32_t current, std::uint32_t total) {
            std::cout << "\r  chunk " << current << "/" << total << std::flush;
        });

        auto result = transfers.send_photo(*photo);
        std::cout << "\n";
        connection.disconnect();

        if (!result) {
            return CommandResult::error("Transfer failed: " + result.message);
        }

        const auto& stats = *result.statistics;
        std::cout << "Photo delivered\n";
        std::cout << "  Size: " << stats.total_bytes << " bytes\n";
        std::cout << "  Chunks: " << stats.total_chunks << "\n";
        std::cout << "  Time: " << stats.elapsed_time_ms << " ms\n";
        std::cout << "  Rate: " << std::fixed << std::setprecision(1) << stats.transfer_rate_kbps << " KB/s\n";
        std::cout << "  Retries: " << stats.retry_count << "\n";

        return CommandResult::ok("Photo sent");

    } catch (const std::exception& e) {
        LOG_ERROR("Send failed: {}", e.what());
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// ReceiveCommandHandler Implementation
CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;

    auto& config = Config::instance();
    int port = config.get_int("listen.port", 7004);
    std::filesystem::path output_dir = config.get_string("receiver.output_dir", ".");

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return CommandResult::error("Cannot create output directory " + output_dir.string() + ": " + ec.message());
    }

    if (port < 0 || port > 0xFFFF) {
        return CommandResult::error("Invalid listen port: " + std::to_string(port));
    }

    try {
        network::ConnectionManager connection(network::ConnectionOptions::from_config(config));
        transfer::TransferManager transfers(connection,
                                            transfer::SenderOptions::from_config(config),
                                            transfer::ReceiverOptions::from_config(config));

        std::atomic<int> received{0};
        transfers.set_photo_handler([&](transfer::ReceivedPhoto photo) {
            int sequence = ++received;
            auto path = output_dir / photo_filename(photo.received_at, sequence);

            std::ofstream file(path, std::ios::binary);
            file.write(reinterpret_cast<const char*>(photo.payload.data()),
                       static_cast<std::streamsize>(photo.payload.size()));
            if (!file.good()) {
                LOG_ERROR("Failed to write {}", path.string());
                return;
            }

            LOG_INFO("Saved {} ({} bytes, {} ms)", path.string(), photo.payload.size(), photo.transfer_time_ms);
            std::cout << "Received " << path.string() << " (" << photo.payload.size() << " bytes)\n";
        });

        connection.set_message_handler([](const network::ControlMessage& message) {
            LOG_DEBUG("Control message {} from peer", network::control_type_name(message.type));
        });

        std::atomic<bool> stop_requested{false};
        std::unique_ptr<boost::asio::signal_set> signals;
        connection.run_on_io([&]() {
            signals = std::make_unique<boost::asio::signal_set>(connection.io_context(), SIGINT, SIGTERM);
            signals->async_wait([&stop_requested](const boost::system::error_code& error, int) {
                if (!error) {
                    stop_requested = true;
                }
            });
        });

        std::cout << "Saving photos to " << output_dir.string() << "\n";
        std::cout << "Press Ctrl+C to stop\n";

        while (!stop_requested) {
            auto state = connection.state();
            if (std::holds_alternative<network::Disconnected>(state) ||
                std::holds_alternative<network::Failed>(state)) {
                if (!connection.listen(static_cast<std::uint16_t>(port))) {
                    connection.run_on_io([&]() { signals.reset(); });
                    return CommandResult::error("Cannot listen on port " + std::to_string(port) + ": " +
                                                network::describe(connection.state()));
                }
                std::cout << "Listening on port " << connection.listening_port() << "\n";
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Stopping receiver after {} photos", received.load());
        connection.run_on_io([&]() { signals.reset(); });
        connection.disconnect();

        return CommandResult::ok();

    } catch (const std::exception& e) {
        LOG_ERROR("Receive failed: {}", e.what());
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

}
