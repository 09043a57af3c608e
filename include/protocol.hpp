
#pragma once
#include <cstdint>
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace swarmcast {

constexpr uint8_t  kVersion = 1;
constexpr size_t   kHeaderSize = 16;       // ver|type|seq|timestamp|payload_len
constexpr size_t   kChunkHeaderSize = 8;   // frame_id|total_frags|fragment_index
constexpr size_t   kMaxPayload = 0xFFFF;
constexpr uint32_t kFragmentsPerFrame = 1000;
constexpr size_t   kMaxFragmentSize = 1000;
// Ids one BITMAP may expand to: a full 300-frame horizon.
constexpr size_t   kMaxBitmapIds = 300 * (size_t)kFragmentsPerFrame;

using ChunkId = uint64_t;
using Bitmap = std::set<ChunkId>;

enum class MsgType : uint8_t {
    HANDSHAKE = 1,
    HEARTBEAT = 2,
    BITMAP    = 3,
    REQUEST   = 4,
    DATA      = 5,
    PEER_LIST = 6,
    PING      = 7,
    PONG      = 8,
    STATS_REPORT = 9
};

enum class NodeRole : uint8_t { Viewer = 0, Origin = 1 };

enum HandshakeFlags : uint8_t {
    HF_REPLY_REQUESTED = 0x01
};

struct Packet {
    uint8_t  version{kVersion};
    MsgType  type{MsgType::HEARTBEAT};
    uint32_t sequence{0};
    double   timestamp{0.0};
    std::vector<uint8_t> payload;
};

enum class DecodeStatus { Ok, TooShort, BadVersion, LengthMismatch };

const char* decode_status_str(DecodeStatus st);
const char* msg_type_str(MsgType t);
const char* role_str(NodeRole r);

// Fails only when the payload does not fit the 16-bit length field.
bool encode_packet(const Packet& p, std::vector<uint8_t>& out);
DecodeStatus decode_packet(const uint8_t* data, size_t len, Packet& out);

struct ChunkHeader {
    uint32_t frame_id{0};
    uint16_t total_frags{0};
    uint16_t fragment_index{0};
};

inline ChunkId make_chunk_id(uint32_t frame_id, uint16_t fragment_index) {
    return (ChunkId)frame_id * kFragmentsPerFrame + fragment_index;
}
inline uint32_t frame_of(ChunkId id) { return (uint32_t)(id / kFragmentsPerFrame); }

void encode_chunk_payload(const ChunkHeader& h, const uint8_t* data, size_t len,
                          std::vector<uint8_t>& out);
bool decode_chunk_header(const std::vector<uint8_t>& payload, ChunkHeader& out);

// Run-length ranges, newest `max_ranges` kept.
std::vector<uint8_t> encode_bitmap(const Bitmap& bm, size_t max_ranges);
// Rejects payloads expanding to more than max_ids chunk ids.
bool decode_bitmap(const std::vector<uint8_t>& payload, Bitmap& out,
                   size_t max_ids = kMaxBitmapIds);

std::vector<uint8_t> encode_request(ChunkId id);
bool decode_request(const std::vector<uint8_t>& payload, ChunkId& out);

std::vector<uint8_t> encode_handshake(NodeRole role, uint8_t flags);
bool decode_handshake(const std::vector<uint8_t>& payload, NodeRole& role, uint8_t& flags);

// PING carries the sender's clock reading; PONG echoes it unchanged.
std::vector<uint8_t> encode_ping(uint64_t stamp);
bool decode_ping(const std::vector<uint8_t>& payload, uint64_t& stamp);

// Viewer health as reported to the origin. Rates in bytes per second.
struct StatsReport {
    NodeRole role{NodeRole::Viewer};
    uint32_t download_rate{0};
    uint32_t upload_rate{0};
    uint16_t buffered_frames{0};
    uint16_t peer_count{0};
    uint32_t avg_rtt_us{0};
};

std::vector<uint8_t> encode_stats_report(const StatsReport& r);
bool decode_stats_report(const std::vector<uint8_t>& payload, StatsReport& out);

struct PeerEntry {
    std::string host;
    uint16_t port{0};
    NodeRole role{NodeRole::Viewer};
};

std::vector<uint8_t> encode_peer_list(const std::vector<PeerEntry>& peers);
bool decode_peer_list(const std::vector<uint8_t>& payload, std::vector<PeerEntry>& out);

} // namespace swarmcast
