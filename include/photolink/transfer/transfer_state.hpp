#pragma once

#include "photolink/network/photo_protocol.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace photolink::transfer {

struct Idle {};

struct InProgress {
    std::uint32_t current_chunk;
    std::uint32_t total_chunks;
    std::uint64_t bytes_transferred;
    std::uint64_t total_bytes;
};

struct Success {
    std::vector<std::uint8_t> payload;
};

struct Error {
    std::string message;
    std::optional<network::StatusCode> status;
};

using TransferState = std::variant<Idle, InProgress, Success, Error>;

std::string describe(const TransferState& state);

inline bool is_terminal(const TransferState& state) {
    return std::holds_alternative<Success>(state) || std::holds_alternative<Error>(state);
}

struct TransferStatistics {
    std::uint64_t total_bytes;
    std::uint32_t total_chunks;
    std::uint64_t elapsed_time_ms;
    double transfer_rate_kbps;
    std::uint32_t retry_count;
};

enum class TransferError {
    SUCCESS = 0,
    INVALID_PAYLOAD,
    INVALID_STATE,
    NOT_CONNECTED,
    TRANSPORT_FAILURE,
    REJECTED,
    TIMEOUT,
    CANCELLED,
    CONNECTION_LOST
};

struct TransferResult {
    TransferError error;
    std::string message;
    std::optional<TransferStatistics> statistics;

    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    static TransferResult ok(TransferStatistics stats) {
        TransferResult result;
        result.statistics = stats;
        return result;
    }

    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

}
