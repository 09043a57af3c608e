
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "protocol.hpp"

namespace swarmcast {

// Payloads keyed by chunk id; the local bitmap is the key set.
class ChunkStore {
public:
    // First writer wins: returns false if the chunk was already held.
    bool put(ChunkId id, std::vector<uint8_t> payload);
    bool has(ChunkId id) const { return chunks_.count(id) != 0; }
    // nullptr when the chunk is not held.
    const std::vector<uint8_t>* get(ChunkId id) const;

    // Removes every chunk with id < bound, returns how many went.
    size_t evict_below(ChunkId bound);

    const Bitmap& bitmap() const { return bitmap_; }
    size_t size() const { return chunks_.size(); }
    bool empty() const { return chunks_.empty(); }
    size_t bytes() const { return bytes_; }
    std::optional<ChunkId> lowest() const;
    std::optional<ChunkId> highest() const;

    // "N chunks (lo-hi)" for dashboards and logs.
    std::string summary() const;

private:
    std::unordered_map<ChunkId, std::vector<uint8_t>> chunks_;
    Bitmap bitmap_;
    size_t bytes_{0};
};

} // namespace swarmcast
