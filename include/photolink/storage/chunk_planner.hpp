#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace photolink::storage {

std::uint32_t chunk_count_for(std::uint64_t total_size, std::uint32_t chunk_size);

// Ordered views into data; the last one may be shorter.
std::vector<std::span<const std::uint8_t>> split(std::span<const std::uint8_t> data, std::uint32_t chunk_size);

struct MissingChunks {
    std::vector<std::uint32_t> indices;
};

using ReassemblyResult = std::variant<std::vector<std::uint8_t>, MissingChunks>;

// Pre-sized slot per chunk index; missing detection is a scan over the slots.
class ChunkArena {
public:
    explicit ChunkArena(std::uint32_t total_chunks);

    // Returns false for an out-of-range index. Overwrites an existing slot.
    bool store(std::uint32_t index, std::vector<std::uint8_t> data);
    bool has(std::uint32_t index) const;

    std::uint32_t total_chunks() const { return static_cast<std::uint32_t>(slots_.size()); }
    std::uint32_t stored_count() const { return stored_count_; }
    std::uint64_t stored_bytes() const { return stored_bytes_; }
    bool complete() const { return stored_count_ == slots_.size(); }

    std::vector<std::uint32_t> missing() const;
    ReassemblyResult reassemble() const;

private:
    std::vector<std::optional<std::vector<std::uint8_t>>> slots_;
    std::uint32_t stored_count_;
    std::uint64_t stored_bytes_;
};

ReassemblyResult reassemble(const std::map<std::uint32_t, std::vector<std::uint8_t>>& chunks,
                            std::uint32_t total_chunks);

}
