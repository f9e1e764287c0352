#include "photolink/storage/chunk_planner.hpp"
#include <algorithm>
#include <stdexcept>

namespace photolink::storage {

std::uint32_t chunk_count_for(std::uint64_t total_size, std::uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    return static_cast<std::uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

std::vector<std::span<const std::uint8_t>> split(std::span<const std::uint8_t> data, std::uint32_t chunk_size) {
    std::vector<std::span<const std::uint8_t>> chunks;
    chunks.reserve(chunk_count_for(data.size(), chunk_size));

    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
        chunks.push_back(data.subspan(offset, std::min<std::size_t>(chunk_size, data.size() - offset)));
    }
    return chunks;
}

ChunkArena::ChunkArena(std::uint32_t total_chunks)
    : slots_(total_chunks)
    , stored_count_(0)
    , stored_bytes_(0) {
}

bool ChunkArena::store(std::uint32_t index, std::vector<std::uint8_t> data) {
    if (index >= slots_.size()) {
        return false;
    }

    auto& slot = slots_[index];
    if (slot) {
        stored_bytes_ -= slot->size();
    } else {
        ++stored_count_;
    }

    stored_bytes_ += data.size();
    slot = std::move(data);
    return true;
}

bool ChunkArena::has(std::uint32_t index) const {
    return index < slots_.size() && slots_[index].has_value();
}

std::vector<std::uint32_t> ChunkArena::missing() const {
    std::vector<std::uint32_t> indices;
    for (std::uint32_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]) {
            indices.push_back(i);
        }
    }
    return indices;
}

ReassemblyResult ChunkArena::reassemble() const {
    if (!complete()) {
        return MissingChunks{missing()};
    }

    std::vector<std::uint8_t> data;
    data.reserve(stored_bytes_);
    for (const auto& slot : slots_) {
        data.insert(data.end(), slot->begin(), slot->end());
    }
    return data;
}

ReassemblyResult reassemble(const std::map<std::uint32_t, std::vector<std::uint8_t>>& chunks,
                            std::uint32_t total_chunks) {
    ChunkArena arena(total_chunks);
    for (const auto& [index, data] : chunks) {
        arena.store(index, data);
    }
    return arena.reassemble();
}

}
