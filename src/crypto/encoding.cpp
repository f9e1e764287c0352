#include "photolink/crypto/encoding.hpp"
#include <openssl/evp.h>

namespace photolink::crypto {

std::string base64_encode(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return {};
    }

    std::string output(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                  data.data(), static_cast<int>(data.size()));
    output.resize(static_cast<std::size_t>(written));
    return output;
}

std::optional<std::vector<std::uint8_t>> base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return std::vector<std::uint8_t>{};
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> output(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(output.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes.
    std::size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;

    output.resize(static_cast<std::size_t>(written) - padding);
    return output;
}

}
