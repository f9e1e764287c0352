#include <gtest/gtest.h>
#include "photolink/transfer/photo_receiver.hpp"
#include "photolink/core/config.hpp"
#include "photolink/storage/chunk_planner.hpp"
#include "test_support.hpp"

using namespace photolink::transfer;
using namespace photolink::network;
using photolink::testing::RecordingWriter;
using photolink::testing::make_photo;

class PhotoReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.inactivity_timeout = std::chrono::seconds(10);
        options.recovery_timeout = std::chrono::seconds(10);
        create_receiver();
    }

    void create_receiver() {
        receiver = std::make_shared<PhotoReceiver>(io, writer, options);
        receiver->set_photo_handler([this](ReceivedPhoto photo) {
            delivered.push_back(std::move(photo));
        });
    }

    void run_io(std::chrono::milliseconds duration) {
        io.restart();
        io.run_for(duration);
    }

    void start(const std::vector<std::uint8_t>& photo, std::uint32_t chunk_size = CHUNK_SIZE) {
        auto chunk_count = photolink::storage::chunk_count_for(photo.size(), chunk_size);
        receiver->handle_packet(encode_start(static_cast<std::uint32_t>(photo.size()), chunk_count,
                                             photolink::crypto::compute_md5(photo)));
    }

    void send_chunk(const std::vector<std::uint8_t>& photo, std::uint32_t index, std::uint32_t chunk_size = CHUNK_SIZE) {
        auto chunks = photolink::storage::split(photo, chunk_size);
        receiver->handle_packet(encode_data(index, chunks.at(index)));
    }

    void send_end(StatusCode status = StatusCode::SUCCESS) {
        receiver->handle_packet(encode_end(status));
    }

    TransferState state() const { return receiver->state().get(); }

    boost::asio::io_context io;
    RecordingWriter writer;
    ReceiverOptions options;
    std::shared_ptr<PhotoReceiver> receiver;
    std::vector<ReceivedPhoto> delivered;
};

TEST_F(PhotoReceiverTest, ReceivesPhotoInTwoChunks) {
    auto photo = make_photo(5000);

    start(photo);
    EXPECT_TRUE(receiver->is_active());
    send_chunk(photo, 0);
    send_chunk(photo, 1);
    send_end();

    auto packets = writer.packets();
    ASSERT_EQ(packets.size(), 3u);
    EXPECT_EQ(packets[0], encode_ack(0, StatusCode::SUCCESS));
    EXPECT_EQ(packets[1], encode_ack(0, StatusCode::SUCCESS));
    EXPECT_EQ(packets[2], encode_ack(1, StatusCode::SUCCESS));

    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].payload, photo);

    auto current = state();
    ASSERT_TRUE(std::holds_alternative<Success>(current));
    EXPECT_EQ(std::get<Success>(current).payload, photo);
    EXPECT_FALSE(receiver->is_active());
}

TEST_F(PhotoReceiverTest, ProgressTracksStoredChunks) {
    auto photo = make_photo(4096 * 3);

    start(photo);
    auto initial = std::get<InProgress>(state());
    EXPECT_EQ(initial.current_chunk, 0u);
    EXPECT_EQ(initial.total_chunks, 3u);
    EXPECT_EQ(initial.total_bytes, photo.size());

    send_chunk(photo, 2);
    auto progress = std::get<InProgress>(state());
    EXPECT_EQ(progress.current_chunk, 1u);
    EXPECT_EQ(progress.bytes_transferred, 4096u);
}

TEST_F(PhotoReceiverTest, CorruptChunkRequestsRetry) {
    auto photo = make_photo(3000);
    start(photo);
    writer.clear();

    auto packet = encode_data(0, photo);
    packet[DATA_HEADER_SIZE + 10] ^= 0x01;
    receiver->handle_packet(packet);

    auto packets = writer.packets();
    ASSERT_EQ(packets.size(), 1u);
    EXPECT_EQ(packets[0], encode_retry(0));
    EXPECT_EQ(receiver->stored_chunks(), 0u);
    EXPECT_TRUE(std::holds_alternative<InProgress>(state()));
}

TEST_F(PhotoReceiverTest, GapAtEndRequestsOnlyMissingChunk) {
    auto photo = make_photo(4096 * 3);
    start(photo);
    send_chunk(photo, 0);
    send_chunk(photo, 2);
    writer.clear();

    send_end();

    auto packets = writer.packets();
    ASSERT_EQ(packets.size(), 1u);
    EXPECT_EQ(packets[0], encode_retry(1));
    EXPECT_TRUE(receiver->is_active());
    EXPECT_EQ(receiver->stored_chunks(), 2u);
    EXPECT_TRUE(std::holds_alternative<InProgress>(state()));
    EXPECT_TRUE(delivered.empty());

    send_chunk(photo, 1);
    send_end();

    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].payload, photo);
}

TEST_F(PhotoReceiverTest, DuplicateChunkIsIdempotent) {
    auto photo = make_photo(6000);
    start(photo);
    send_chunk(photo, 0);
    send_chunk(photo, 0);

    EXPECT_EQ(writer.packets_of(PacketKind::ACK).size(), 3u);
    EXPECT_EQ(receiver->stored_chunks(), 1u);

    send_chunk(photo, 1);
    send_end();

    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].payload, photo);
}

TEST_F(PhotoReceiverTest, Md5MismatchFailsTransfer) {
    auto photo = make_photo(100);
    auto wrong = photolink::crypto::compute_md5(make_photo(100, 99));
    receiver->handle_packet(encode_start(100, 1, wrong));
    send_chunk(photo, 0);
    send_end();

    EXPECT_TRUE(delivered.empty());
    auto current = state();
    ASSERT_TRUE(std::holds_alternative<Error>(current));
    EXPECT_EQ(std::get<Error>(current).message, "md5 mismatch");
    EXPECT_EQ(std::get<Error>(current).status, StatusCode::MD5_ERROR);
}

TEST_F(PhotoReceiverTest, InvalidStartIsRejected) {
    photolink::crypto::Md5Digest md5{};
    receiver->handle_packet(encode_start(0, 1, md5));
    receiver->handle_packet(encode_start(MAX_PHOTO_SIZE + 1, MAX_CHUNKS, md5));
    receiver->handle_packet(encode_start(100, MAX_CHUNKS + 1, md5));
    receiver->handle_packet(encode_start(100, 0, md5));

    auto packets = writer.packets();
    ASSERT_EQ(packets.size(), 4u);
    for (const auto& packet : packets) {
        EXPECT_EQ(packet, encode_ack(0, StatusCode::GENERIC_ERROR));
    }
    EXPECT_FALSE(receiver->is_active());
    EXPECT_TRUE(std::holds_alternative<Idle>(state()));
}

TEST_F(PhotoReceiverTest, InvalidStartLeavesActiveSessionAlone) {
    auto photo = make_photo(5000);
    start(photo);
    send_chunk(photo, 0);

    photolink::crypto::Md5Digest md5{};
    receiver->handle_packet(encode_start(0, 0, md5));

    EXPECT_TRUE(receiver->is_active());
    EXPECT_EQ(receiver->stored_chunks(), 1u);

    send_chunk(photo, 1);
    send_end();
    ASSERT_EQ(delivered.size(), 1u);
}

TEST_F(PhotoReceiverTest, NewStartDiscardsPreviousSession) {
    auto first = make_photo(5000, 1);
    auto second = make_photo(3000, 2);

    start(first);
    send_chunk(first, 0);
    start(second);

    EXPECT_EQ(receiver->stored_chunks(), 0u);
    send_chunk(second, 0);
    send_end();

    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].payload, second);
}

TEST_F(PhotoReceiverTest, OutOfRangeChunkIsNacked) {
    auto photo = make_photo(100);
    start(photo);
    writer.clear();

    receiver->handle_packet(encode_data(5, std::vector<std::uint8_t>{1, 2, 3}));

    auto packets = writer.packets();
    ASSERT_EQ(packets.size(), 1u);
    EXPECT_EQ(packets[0], encode_ack(5, StatusCode::GENERIC_ERROR));
    EXPECT_EQ(receiver->stored_chunks(), 0u);
}

TEST_F(PhotoReceiverTest, ChunkOfWrongSizeIsNacked) {
    auto photo = make_photo(CHUNK_SIZE + 100);
    start(photo);
    writer.clear();

    // A short middle chunk and an oversized last chunk.
    receiver->handle_packet(encode_data(0, std::vector<std::uint8_t>(photo.begin(), photo.begin() + 100)));
    receiver->handle_packet(encode_data(1, std::vector<std::uint8_t>(photo.begin(), photo.begin() + 200)));

    auto packets = writer.packets();
    ASSERT_EQ(packets.size(), 2u);
    EXPECT_EQ(packets[0], encode_ack(0, StatusCode::GENERIC_ERROR));
    EXPECT_EQ(packets[1], encode_ack(1, StatusCode::GENERIC_ERROR));
    EXPECT_EQ(receiver->stored_chunks(), 0u);

    auto current = state();
    ASSERT_TRUE(std::holds_alternative<InProgress>(current));
    EXPECT_EQ(std::get<InProgress>(current).bytes_transferred, 0u);

    send_chunk(photo, 0);
    send_chunk(photo, 1);
    send_end();
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].payload, photo);
}

TEST_F(PhotoReceiverTest, DataAndEndWithoutSessionAreIgnored) {
    auto photo = make_photo(100);
    send_chunk(photo, 0);
    send_end();
    receiver->handle_packet(encode_ack(0, StatusCode::SUCCESS));
    receiver->handle_packet(encode_retry(0));
    receiver->handle_packet(std::vector<std::uint8_t>{0x01, 0x02});

    EXPECT_TRUE(writer.packets().empty());
    EXPECT_TRUE(std::holds_alternative<Idle>(state()));
}

TEST_F(PhotoReceiverTest, SenderFailureEndsSession) {
    auto photo = make_photo(5000);
    start(photo);
    send_end(StatusCode::GENERIC_ERROR);

    auto current = state();
    ASSERT_TRUE(std::holds_alternative<Error>(current));
    EXPECT_EQ(std::get<Error>(current).status, StatusCode::GENERIC_ERROR);
    EXPECT_FALSE(receiver->is_active());
}

TEST_F(PhotoReceiverTest, InactivityTimeout) {
    options.inactivity_timeout = std::chrono::milliseconds(20);
    create_receiver();

    auto photo = make_photo(5000);
    start(photo);
    run_io(std::chrono::milliseconds(500));

    auto current = state();
    ASSERT_TRUE(std::holds_alternative<Error>(current));
    EXPECT_EQ(std::get<Error>(current).message, "timeout");
    EXPECT_EQ(std::get<Error>(current).status, StatusCode::TIMEOUT);
    EXPECT_FALSE(receiver->is_active());
}

TEST_F(PhotoReceiverTest, UnrecoveredGapTimesOut) {
    options.recovery_timeout = std::chrono::milliseconds(30);
    create_receiver();

    auto photo = make_photo(4096 * 2);
    start(photo);
    send_chunk(photo, 0);
    send_end();
    run_io(std::chrono::milliseconds(10));
    send_end();

    run_io(std::chrono::milliseconds(300));

    auto current = state();
    ASSERT_TRUE(std::holds_alternative<Error>(current));
    EXPECT_EQ(std::get<Error>(current).message, "missing chunks not recovered");
    EXPECT_EQ(std::get<Error>(current).status, StatusCode::TIMEOUT);
    EXPECT_EQ(writer.packets_of(PacketKind::RETRY).size(), 2u);
}

TEST_F(PhotoReceiverTest, CompletedSessionCancelsTimers) {
    options.inactivity_timeout = std::chrono::milliseconds(20);
    create_receiver();

    auto photo = make_photo(100);
    start(photo);
    send_chunk(photo, 0);
    send_end();
    run_io(std::chrono::milliseconds(100));

    EXPECT_TRUE(std::holds_alternative<Success>(state()));
}

TEST_F(PhotoReceiverTest, CancelAbortAndReset) {
    auto photo = make_photo(5000);

    receiver->cancel();
    EXPECT_TRUE(std::holds_alternative<Idle>(state()));

    start(photo);
    receiver->cancel();
    ASSERT_TRUE(std::holds_alternative<Error>(state()));
    EXPECT_EQ(std::get<Error>(state()).message, "cancelled");

    start(photo);
    receiver->abort("connection lost");
    ASSERT_TRUE(std::holds_alternative<Error>(state()));
    EXPECT_EQ(std::get<Error>(state()).message, "connection lost");

    start(photo);
    send_chunk(photo, 0);
    receiver->reset();
    EXPECT_TRUE(std::holds_alternative<Idle>(state()));
    EXPECT_FALSE(receiver->is_active());
}

TEST_F(PhotoReceiverTest, WriteFailuresDoNotBreakSession) {
    writer.set_failing(true);
    auto photo = make_photo(100);

    EXPECT_NO_THROW(start(photo));
    EXPECT_NO_THROW(send_chunk(photo, 0));
    EXPECT_NO_THROW(send_end());

    ASSERT_EQ(delivered.size(), 1u);
}

TEST_F(PhotoReceiverTest, OptionsFromConfig) {
    photolink::core::Config config;
    config.set("receiver.inactivity_timeout_ms", "1234");
    config.set("receiver.recovery_timeout_ms", "567");

    auto loaded = ReceiverOptions::from_config(config);
    EXPECT_EQ(loaded.inactivity_timeout.count(), 1234);
    EXPECT_EQ(loaded.recovery_timeout.count(), 567);
}
