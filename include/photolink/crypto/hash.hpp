#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace photolink::crypto {

constexpr std::size_t MD5_DIGEST_SIZE = 16;

using Md5Digest = std::array<std::uint8_t, MD5_DIGEST_SIZE>;

enum class HashError {
    SUCCESS = 0,
    INITIALIZATION_FAILED,
    UPDATE_FAILED,
    FINALIZATION_FAILED,
    INVALID_STATE
};

struct HashResult {
    HashError error;
    std::string message;

    HashResult(HashError err = HashError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == HashError::SUCCESS; }
    operator bool() const { return success(); }
};

// Incremental MD5 over OpenSSL EVP.
class Md5Hasher {
public:
    Md5Hasher();
    ~Md5Hasher();

    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;

    HashResult initialize();
    HashResult update(std::span<const std::uint8_t> data);
    HashResult finalize(Md5Digest& output);

    // Throws std::runtime_error when the underlying digest fails.
    Md5Digest finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

Md5Digest compute_md5(std::span<const std::uint8_t> data);
bool verify_md5(std::span<const std::uint8_t> data, std::span<const std::uint8_t> expected);

// IEEE 802.3 CRC-32 (reflected 0xEDB88320, init and xorout 0xFFFFFFFF).
std::uint32_t compute_crc32(std::span<const std::uint8_t> data);

std::string to_hex(std::span<const std::uint8_t> data);

}
