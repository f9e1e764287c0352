#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "photolink/transfer/photo_sender.hpp"
#include "photolink/core/config.hpp"
#include "test_support.hpp"
#include <future>
#include <map>

using namespace photolink::transfer;
using namespace photolink::network;
using photolink::testing::MockPacketWriter;
using photolink::testing::RecordingWriter;
using photolink::testing::make_photo;
using ::testing::_;

namespace {
    MATCHER_P(IsPacketKind, kind, "") {
        return !arg.empty() && arg[0] == static_cast<std::uint8_t>(kind);
    }

    MATCHER_P(IsEndWith, status, "") {
        return arg.size() == END_PACKET_SIZE && arg[0] == 0x03 && arg[1] == static_cast<std::uint8_t>(status);
    }

    PacketKind kind_of(std::span<const std::uint8_t> packet) {
        return static_cast<PacketKind>(packet[0]);
    }
}

class PhotoSenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.chunk_delay = std::chrono::milliseconds(0);
        options.retry_delay = std::chrono::milliseconds(1);
        options.ack_timeout = std::chrono::milliseconds(500);
        options.transfer_timeout = std::chrono::milliseconds(5000);
    }

    // Acknowledges START and every DATA chunk the way a healthy receiver would.
    void ack_everything(PhotoSender& sender) {
        writer.set_hook([&sender](std::span<const std::uint8_t> packet) {
            switch (kind_of(packet)) {
                case PacketKind::START:
                    sender.handle_packet(encode_ack(0, StatusCode::SUCCESS));
                    break;
                case PacketKind::DATA:
                    sender.handle_packet(encode_ack(decode_data(packet).chunk_index, StatusCode::SUCCESS));
                    break;
                default:
                    break;
            }
        });
    }

    SenderOptions options;
    RecordingWriter writer;
};

TEST_F(PhotoSenderTest, SendsStartChunksEndAndSucceeds) {
    PhotoSender sender(writer, options);
    ack_everything(sender);

    auto photo = make_photo(10000);
    auto result = sender.send(photo);

    ASSERT_TRUE(result) << result.message;
    ASSERT_TRUE(result.statistics.has_value());
    EXPECT_EQ(result.statistics->total_bytes, 10000u);
    EXPECT_EQ(result.statistics->total_chunks, 3u);
    EXPECT_EQ(result.statistics->retry_count, 0u);

    auto packets = writer.packets();
    ASSERT_EQ(packets.size(), 5u);

    auto start = decode_start(packets[0]);
    EXPECT_EQ(start.total_size, 10000u);
    EXPECT_EQ(start.total_chunks, 3u);
    EXPECT_EQ(start.md5, photolink::crypto::compute_md5(photo));

    for (std::uint32_t i = 0; i < 3; ++i) {
        auto data = decode_data(packets[1 + i]);
        EXPECT_EQ(data.chunk_index, i);
        EXPECT_TRUE(data.is_valid);
    }
    EXPECT_EQ(decode_end(packets[4]).status, StatusCode::SUCCESS);

    auto state = sender.state().get();
    ASSERT_TRUE(std::holds_alternative<Success>(state));
    EXPECT_EQ(std::get<Success>(state).payload, photo);
    EXPECT_EQ(sender.phase(), SenderPhase::SUCCESS);
}

TEST_F(PhotoSenderTest, EmptyPayloadRejectedWithoutWriting) {
    MockPacketWriter mock;
    EXPECT_CALL(mock, write_packet(_)).Times(0);

    PhotoSender sender(mock, options);
    auto result = sender.send({});

    EXPECT_EQ(result.error, TransferError::INVALID_PAYLOAD);
    auto state = sender.state().get();
    ASSERT_TRUE(std::holds_alternative<Error>(state));
    EXPECT_EQ(std::get<Error>(state).message, "empty payload");
}

TEST_F(PhotoSenderTest, OversizedPayloadRejectedBeforeStart) {
    MockPacketWriter mock;
    EXPECT_CALL(mock, write_packet(_)).Times(0);

    PhotoSender sender(mock, options);
    std::vector<std::uint8_t> photo(MAX_PHOTO_SIZE + 1, 0xAB);
    auto result = sender.send(photo);

    EXPECT_EQ(result.error, TransferError::INVALID_PAYLOAD);
    auto state = sender.state().get();
    ASSERT_TRUE(std::holds_alternative<Error>(state));
    EXPECT_NE(std::get<Error>(state).message.find("exceeds"), std::string::npos);
}

TEST_F(PhotoSenderTest, MaximumSizePhotoIsAccepted) {
    PhotoSender sender(writer, options);
    ack_everything(sender);

    std::vector<std::uint8_t> photo(MAX_PHOTO_SIZE, 0x11);
    auto result = sender.send(photo);

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.statistics->total_chunks, MAX_CHUNKS);
}

TEST_F(PhotoSenderTest, ChunkWriteAttemptsAreBounded) {
    MockPacketWriter mock;
    {
        ::testing::InSequence sequence;
        EXPECT_CALL(mock, write_packet(IsPacketKind(PacketKind::START))).Times(1);
        EXPECT_CALL(mock, write_packet(IsPacketKind(PacketKind::DATA)))
            .Times(MAX_RETRY_COUNT)
            .WillRepeatedly(::testing::Throw(boost::system::system_error(boost::asio::error::broken_pipe)));
        EXPECT_CALL(mock, write_packet(IsEndWith(StatusCode::GENERIC_ERROR))).Times(1);
    }

    PhotoSender sender(mock, options);
    auto result = sender.send(make_photo(5000));

    EXPECT_EQ(result.error, TransferError::TRANSPORT_FAILURE);
    EXPECT_EQ(sender.retry_count(), static_cast<std::uint32_t>(MAX_RETRY_COUNT - 1));

    auto state = sender.state().get();
    ASSERT_TRUE(std::holds_alternative<Error>(state));
    EXPECT_EQ(std::get<Error>(state).status, StatusCode::GENERIC_ERROR);
}

TEST_F(PhotoSenderTest, StartWriteFailureIsTransportFailure) {
    writer.set_failing(true);
    PhotoSender sender(writer, options);

    auto result = sender.send(make_photo(100));

    EXPECT_EQ(result.error, TransferError::TRANSPORT_FAILURE);
    EXPECT_TRUE(std::holds_alternative<Error>(sender.state().get()));
}

TEST_F(PhotoSenderTest, NegativeStartAckRejectsTransfer) {
    PhotoSender sender(writer, options);
    writer.set_hook([&sender](std::span<const std::uint8_t> packet) {
        if (kind_of(packet) == PacketKind::START) {
            sender.handle_packet(encode_ack(0, StatusCode::GENERIC_ERROR));
        }
    });

    auto result = sender.send(make_photo(9000));

    EXPECT_EQ(result.error, TransferError::REJECTED);
    EXPECT_TRUE(writer.packets_of(PacketKind::DATA).empty());
    auto state = sender.state().get();
    ASSERT_TRUE(std::holds_alternative<Error>(state));
    EXPECT_EQ(std::get<Error>(state).message, "rejected by receiver");
}

TEST_F(PhotoSenderTest, RetryDuringChunksResendsThatChunk) {
    PhotoSender sender(writer, options);
    std::map<std::uint32_t, int> seen;
    writer.set_hook([&sender, &seen](std::span<const std::uint8_t> packet) {
        if (kind_of(packet) == PacketKind::START) {
            sender.handle_packet(encode_ack(0, StatusCode::SUCCESS));
        } else if (kind_of(packet) == PacketKind::DATA) {
            auto index = decode_data(packet).chunk_index;
            if (index == 1 && seen[index]++ == 0) {
                sender.handle_packet(encode_retry(1));
            } else {
                sender.handle_packet(encode_ack(index, StatusCode::SUCCESS));
            }
        }
    });

    auto result = sender.send(make_photo(12000));

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.statistics->retry_count, 1u);

    auto data = writer.packets_of(PacketKind::DATA);
    ASSERT_EQ(data.size(), 4u);
    EXPECT_EQ(decode_data(data[1]).chunk_index, 1u);
    EXPECT_EQ(decode_data(data[2]).chunk_index, 1u);
    EXPECT_EQ(writer.packets_of(PacketKind::END).size(), 1u);
}

TEST_F(PhotoSenderTest, RetryAfterEndResendsAndRepeatsEnd) {
    PhotoSender sender(writer, options);
    int ends = 0;
    std::map<std::uint32_t, int> seen;
    writer.set_hook([&](std::span<const std::uint8_t> packet) {
        switch (kind_of(packet)) {
            case PacketKind::START:
                sender.handle_packet(encode_ack(0, StatusCode::SUCCESS));
                break;
            case PacketKind::DATA: {
                auto index = decode_data(packet).chunk_index;
                // Chunk 2 is lost on its first trip.
                if (index != 2 || seen[index]++ > 0) {
                    sender.handle_packet(encode_ack(index, StatusCode::SUCCESS));
                }
                break;
            }
            case PacketKind::END:
                if (ends++ == 0) {
                    sender.handle_packet(encode_retry(2));
                }
                break;
            default:
                break;
        }
    });

    auto result = sender.send(make_photo(4096 * 3));

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.statistics->retry_count, 1u);
    EXPECT_EQ(writer.packets_of(PacketKind::END).size(), 2u);
    EXPECT_EQ(writer.packets_of(PacketKind::DATA).size(), 4u);
}

TEST_F(PhotoSenderTest, SilentReceiverAfterEndCountsAsDelivered) {
    options.ack_timeout = std::chrono::milliseconds(50);
    PhotoSender sender(writer, options);
    writer.set_hook([&sender](std::span<const std::uint8_t> packet) {
        if (kind_of(packet) == PacketKind::START) {
            sender.handle_packet(encode_ack(0, StatusCode::SUCCESS));
        }
    });

    auto result = sender.send(make_photo(6000));

    EXPECT_TRUE(result) << result.message;
    EXPECT_TRUE(std::holds_alternative<Success>(sender.state().get()));
}

TEST_F(PhotoSenderTest, OverallTimeoutReportsTimeout) {
    options.chunk_delay = std::chrono::milliseconds(30);
    options.transfer_timeout = std::chrono::milliseconds(50);
    PhotoSender sender(writer, options);

    auto result = sender.send(make_photo(4096 * 5));

    EXPECT_EQ(result.error, TransferError::TIMEOUT);
    auto state = sender.state().get();
    ASSERT_TRUE(std::holds_alternative<Error>(state));
    EXPECT_EQ(std::get<Error>(state).message, "timeout");
    EXPECT_EQ(std::get<Error>(state).status, StatusCode::TIMEOUT);
}

TEST_F(PhotoSenderTest, CancelStopsTransfer) {
    PhotoSender sender(writer, options);
    writer.set_hook([&sender](std::span<const std::uint8_t> packet) {
        if (kind_of(packet) == PacketKind::DATA) {
            sender.cancel();
        }
    });

    auto result = sender.send(make_photo(4096 * 4));

    EXPECT_EQ(result.error, TransferError::CANCELLED);
    EXPECT_EQ(writer.packets_of(PacketKind::DATA).size(), 1u);
    auto state = sender.state().get();
    ASSERT_TRUE(std::holds_alternative<Error>(state));
    EXPECT_EQ(std::get<Error>(state).message, "cancelled");
}

TEST_F(PhotoSenderTest, CancelFromStateHandlerDoesNotBlock) {
    PhotoSender sender(writer, options);
    sender.state().set_change_handler([&sender](const TransferState& state) {
        if (auto progress = std::get_if<InProgress>(&state); progress && progress->current_chunk == 1) {
            sender.cancel();
        }
    });

    auto photo = make_photo(4096 * 3);
    auto pending = std::async(std::launch::async, [&sender, &photo]() { return sender.send(photo); });
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    auto result = pending.get();
    EXPECT_EQ(result.error, TransferError::CANCELLED);
    EXPECT_EQ(writer.packets_of(PacketKind::DATA).size(), 1u);
    auto state = sender.state().get();
    ASSERT_TRUE(std::holds_alternative<Error>(state));
    EXPECT_EQ(std::get<Error>(state).message, "cancelled");
}

TEST_F(PhotoSenderTest, ConnectionLossAbortsTransfer) {
    PhotoSender sender(writer, options);
    writer.set_hook([&sender](std::span<const std::uint8_t> packet) {
        if (kind_of(packet) == PacketKind::DATA) {
            sender.notify_connection_lost();
        }
    });

    auto result = sender.send(make_photo(4096 * 4));

    EXPECT_EQ(result.error, TransferError::CONNECTION_LOST);
    EXPECT_EQ(std::get<Error>(sender.state().get()).message, "connection lost");
}

TEST_F(PhotoSenderTest, ProgressReportedPerChunk) {
    PhotoSender sender(writer, options);
    ack_everything(sender);

    std::vector<std::pair<std::uint32_t, std::uint32_t>> progress;
    sender.set_progress_callback([&progress](std::uint32_t current, std::uint32_t total) {
        progress.emplace_back(current, total);
    });

    ASSERT_TRUE(sender.send(make_photo(9000)));
    EXPECT_EQ(progress, (std::vector<std::pair<std::uint32_t, std::uint32_t>>{{1, 3}, {2, 3}, {3, 3}}));
}

TEST_F(PhotoSenderTest, SenderIsSingleUse) {
    PhotoSender sender(writer, options);
    ack_everything(sender);

    ASSERT_TRUE(sender.send(make_photo(10)));
    auto second = sender.send(make_photo(10));
    EXPECT_EQ(second.error, TransferError::INVALID_STATE);
}

TEST_F(PhotoSenderTest, IgnoresUnrelatedAndMalformedPackets) {
    PhotoSender sender(writer, options);
    sender.handle_packet(encode_ack(0, StatusCode::GENERIC_ERROR));
    sender.handle_packet(encode_end(StatusCode::SUCCESS));
    sender.handle_packet(std::vector<std::uint8_t>{0x04, 0x00});

    EXPECT_EQ(sender.phase(), SenderPhase::IDLE);
    EXPECT_TRUE(std::holds_alternative<Idle>(sender.state().get()));
}

TEST_F(PhotoSenderTest, OptionsFromConfig) {
    photolink::core::Config config;
    config.set("transfer.chunk_delay_ms", "3");
    config.set("transfer.retry_delay_ms", "40");
    config.set("transfer.ack_timeout_ms", "700");
    config.set("transfer.timeout_ms", "9000");

    auto loaded = SenderOptions::from_config(config);
    EXPECT_EQ(loaded.chunk_delay.count(), 3);
    EXPECT_EQ(loaded.retry_delay.count(), 40);
    EXPECT_EQ(loaded.ack_timeout.count(), 700);
    EXPECT_EQ(loaded.transfer_timeout.count(), 9000);
    EXPECT_EQ(loaded.chunk_size, CHUNK_SIZE);
}
