#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace photolink::crypto {

std::string base64_encode(std::span<const std::uint8_t> data);

// Returns nullopt for input that is not canonical padded base64.
std::optional<std::vector<std::uint8_t>> base64_decode(const std::string& encoded);

}
