#include "photolink/network/frame_parser.hpp"
#include "photolink/core/logger.hpp"
#include <algorithm>

namespace photolink::network {

namespace {
    bool is_frame_start(std::uint8_t byte) {
        return byte == '{' || is_packet_kind(byte);
    }
}

FrameParser::FrameParser(std::size_t max_data_payload, std::size_t max_line_length)
    : max_data_payload_(max_data_payload)
    , max_line_length_(max_line_length)
    , offset_(0)
    , skipped_bytes_(0) {
}

std::vector<Frame> FrameParser::feed(std::span<const std::uint8_t> data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());

    std::vector<Frame> frames;
    while (offset_ < buffer_.size()) {
        std::uint8_t first = buffer_[offset_];

        bool progressed;
        if (first == '{') {
            progressed = try_extract_line(frames);
        } else if (is_packet_kind(first)) {
            progressed = try_extract_packet(frames);
        } else {
            skip_noise();
            progressed = true;
        }

        if (!progressed) {
            break;
        }
    }

    compact();
    return frames;
}

void FrameParser::reset() {
    buffer_.clear();
    offset_ = 0;
}

bool FrameParser::try_extract_line(std::vector<Frame>& frames) {
    auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset_);
    auto newline = std::find(begin, buffer_.end(), static_cast<std::uint8_t>('\n'));

    if (newline == buffer_.end()) {
        if (buffered_bytes() > max_line_length_) {
            LOG_WARN("Control line exceeds {} bytes without a terminator, resynchronizing", max_line_length_);
            ++offset_;
            ++skipped_bytes_;
            return true;
        }
        return false;
    }

    std::string line(begin, newline);
    offset_ += line.size() + 1;

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (auto message = ControlMessage::parse(line)) {
        frames.emplace_back(std::move(*message));
    }
    return true;
}

bool FrameParser::try_extract_packet(std::vector<Frame>& frames) {
    std::span<const std::uint8_t> pending(buffer_.data() + offset_, buffer_.size() - offset_);

    auto length = packet_length(pending);
    if (!length) {
        return false;
    }

    if (pending[0] == static_cast<std::uint8_t>(PacketKind::DATA) &&
        *length - DATA_HEADER_SIZE > max_data_payload_) {
        LOG_DEBUG("DATA header declares {} payload bytes, treating as noise", *length - DATA_HEADER_SIZE);
        ++offset_;
        ++skipped_bytes_;
        return true;
    }

    if (pending.size() < *length) {
        return false;
    }

    BinaryFrame frame;
    frame.bytes.assign(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(*length));
    offset_ += *length;
    frames.emplace_back(std::move(frame));
    return true;
}

void FrameParser::skip_noise() {
    std::size_t start = offset_;
    while (offset_ < buffer_.size() && !is_frame_start(buffer_[offset_])) {
        ++offset_;
    }

    std::size_t skipped = offset_ - start;
    skipped_bytes_ += skipped;

    // Line terminators between frames are expected and not worth a log line.
    bool only_whitespace = std::all_of(buffer_.begin() + static_cast<std::ptrdiff_t>(start),
                                       buffer_.begin() + static_cast<std::ptrdiff_t>(offset_),
                                       [](std::uint8_t b) { return b == '\n' || b == '\r'; });
    if (!only_whitespace) {
        LOG_DEBUG("Skipped {} bytes of line noise", skipped);
    }
}

void FrameParser::compact() {
    if (offset_ == 0) {
        return;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
}

}
