
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include "protocol.hpp"

namespace swarmcast {

struct Chunk {
    ChunkHeader hdr;
    std::vector<uint8_t> data;
    ChunkId id() const { return make_chunk_id(hdr.frame_id, hdr.fragment_index); }
};

// DATA payload (chunk header + fragment bytes) for a chunk, and back.
std::vector<uint8_t> chunk_to_payload(const Chunk& c);
bool chunk_from_payload(const std::vector<uint8_t>& payload, Chunk& out);

class Fragmenter {
public:
    explicit Fragmenter(size_t max_fragment_size = kMaxFragmentSize)
        : max_fragment_size_(max_fragment_size) {}
    // An empty frame still yields one (empty) fragment so it can be carried.
    // Fails when the frame needs more than kFragmentsPerFrame fragments.
    bool split(const std::vector<uint8_t>& frame, uint32_t frame_id,
               std::vector<Chunk>& out) const;
    size_t max_fragment_size() const { return max_fragment_size_; }
private:
    size_t max_fragment_size_;
};

struct CompletedFrame {
    uint32_t frame_id{0};
    std::vector<uint8_t> bytes;
};

class Reassembler {
public:
    explicit Reassembler(size_t max_in_flight = 64) : max_in_flight_(max_in_flight) {}

    std::optional<CompletedFrame> accept(const Chunk& c);

    bool is_stale(uint32_t frame_id) const { return has_emitted_ && frame_id <= last_emitted_; }
    std::optional<uint32_t> last_emitted() const;
    size_t buffered_frames() const { return assemblies_.size(); }
    uint64_t dropped_stale() const { return dropped_stale_; }
    uint64_t dropped_invalid() const { return dropped_invalid_; }
    uint64_t evicted_incomplete() const { return evicted_incomplete_; }

private:
    struct Assembly {
        uint16_t total_frags{0};
        uint16_t received{0};
        size_t bytes{0};
        std::vector<std::vector<uint8_t>> fragments;
        std::vector<bool> present;
    };

    void collect_up_to(uint32_t frame_id);

    size_t max_in_flight_;
    std::map<uint32_t, Assembly> assemblies_;
    bool has_emitted_{false};
    uint32_t last_emitted_{0};
    uint64_t dropped_stale_{0};
    uint64_t dropped_invalid_{0};
    uint64_t evicted_incomplete_{0};
};

} // namespace swarmcast
