
#include "protocol.hpp"
#include <algorithm>
#include <cstring>
#include <iterator>

namespace swarmcast {

namespace {

void put_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back((uint8_t)(v >> 8));
  out.push_back((uint8_t)(v & 0xFF));
}

void put_u32(std::vector<uint8_t> &out, uint32_t v) {
  for (int s = 24; s >= 0; s -= 8)
    out.push_back((uint8_t)(v >> s));
}

void put_u64(std::vector<uint8_t> &out, uint64_t v) {
  for (int s = 56; s >= 0; s -= 8)
    out.push_back((uint8_t)(v >> s));
}

uint16_t get_u16(const uint8_t *p) { return (uint16_t)((p[0] << 8) | p[1]); }

uint32_t get_u32(const uint8_t *p) {
  return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
         ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

uint64_t get_u64(const uint8_t *p) {
  uint64_t v = 0;
  for (int i = 0; i < 8; i++)
    v = (v << 8) | p[i];
  return v;
}

} // namespace

const char *decode_status_str(DecodeStatus st) {
  switch (st) {
  case DecodeStatus::Ok:
    return "ok";
  case DecodeStatus::TooShort:
    return "shorter than header";
  case DecodeStatus::BadVersion:
    return "unknown version";
  default:
    return "payload length mismatch";
  }
}

const char *msg_type_str(MsgType t) {
  switch (t) {
  case MsgType::HANDSHAKE:
    return "HANDSHAKE";
  case MsgType::HEARTBEAT:
    return "HEARTBEAT";
  case MsgType::BITMAP:
    return "BITMAP";
  case MsgType::REQUEST:
    return "REQUEST";
  case MsgType::DATA:
    return "DATA";
  case MsgType::PEER_LIST:
    return "PEER_LIST";
  case MsgType::PING:
    return "PING";
  case MsgType::PONG:
    return "PONG";
  case MsgType::STATS_REPORT:
    return "STATS_REPORT";
  default:
    return "UNKNOWN";
  }
}

const char *role_str(NodeRole r) {
  return r == NodeRole::Origin ? "origin" : "viewer";
}

bool encode_packet(const Packet &p, std::vector<uint8_t> &out) {
  if (p.payload.size() > kMaxPayload)
    return false;
  out.clear();
  out.reserve(kHeaderSize + p.payload.size());
  out.push_back(p.version);
  out.push_back((uint8_t)p.type);
  put_u32(out, p.sequence);
  uint64_t ts_bits;
  static_assert(sizeof(ts_bits) == sizeof(p.timestamp), "double must be 64-bit");
  std::memcpy(&ts_bits, &p.timestamp, sizeof(ts_bits));
  put_u64(out, ts_bits);
  put_u16(out, (uint16_t)p.payload.size());
  out.insert(out.end(), p.payload.begin(), p.payload.end());
  return true;
}

DecodeStatus decode_packet(const uint8_t *data, size_t len, Packet &out) {
  if (len < kHeaderSize)
    return DecodeStatus::TooShort;
  if (data[0] != kVersion)
    return DecodeStatus::BadVersion;
  uint16_t payload_len = get_u16(data + 14);
  if ((size_t)payload_len != len - kHeaderSize)
    return DecodeStatus::LengthMismatch;
  out.version = data[0];
  out.type = (MsgType)data[1];
  out.sequence = get_u32(data + 2);
  uint64_t ts_bits = get_u64(data + 6);
  std::memcpy(&out.timestamp, &ts_bits, sizeof(ts_bits));
  out.payload.assign(data + kHeaderSize, data + len);
  return DecodeStatus::Ok;
}

void encode_chunk_payload(const ChunkHeader &h, const uint8_t *data, size_t len,
                          std::vector<uint8_t> &out) {
  out.clear();
  out.reserve(kChunkHeaderSize + len);
  put_u32(out, h.frame_id);
  put_u16(out, h.total_frags);
  put_u16(out, h.fragment_index);
  if (len)
    out.insert(out.end(), data, data + len);
}

bool decode_chunk_header(const std::vector<uint8_t> &payload, ChunkHeader &out) {
  if (payload.size() < kChunkHeaderSize)
    return false;
  out.frame_id = get_u32(payload.data());
  out.total_frags = get_u16(payload.data() + 4);
  out.fragment_index = get_u16(payload.data() + 6);
  if (out.total_frags == 0 || out.fragment_index >= out.total_frags ||
      out.total_frags > kFragmentsPerFrame)
    return false;
  return true;
}

std::vector<uint8_t> encode_bitmap(const Bitmap &bm, size_t max_ranges) {
  std::vector<std::pair<ChunkId, ChunkId>> ranges;
  for (ChunkId id : bm) {
    if (!ranges.empty() && ranges.back().second + 1 == id)
      ranges.back().second = id;
    else
      ranges.emplace_back(id, id);
  }
  size_t skip = 0;
  if (max_ranges && ranges.size() > max_ranges)
    skip = ranges.size() - max_ranges;
  if (ranges.size() - skip > 0xFFFF)
    skip = ranges.size() - 0xFFFF;

  std::vector<uint8_t> out;
  out.reserve(2 + (ranges.size() - skip) * 16);
  put_u16(out, (uint16_t)(ranges.size() - skip));
  for (auto it = std::next(ranges.begin(), (long)skip); it != ranges.end(); ++it) {
    put_u64(out, it->first);
    put_u64(out, it->second);
  }
  return out;
}

bool decode_bitmap(const std::vector<uint8_t> &payload, Bitmap &out,
                   size_t max_ids) {
  if (payload.size() < 2)
    return false;
  uint16_t count = get_u16(payload.data());
  if (payload.size() != 2 + (size_t)count * 16)
    return false;
  // Size the expansion before allocating anything.
  uint64_t total = 0;
  const uint8_t *p = payload.data() + 2;
  for (uint16_t i = 0; i < count; i++, p += 16) {
    ChunkId first = get_u64(p);
    ChunkId last = get_u64(p + 8);
    if (last < first || last - first >= max_ids)
      return false;
    total += last - first + 1;
    if (total > max_ids)
      return false;
  }
  Bitmap bm;
  p = payload.data() + 2;
  for (uint16_t i = 0; i < count; i++, p += 16) {
    ChunkId first = get_u64(p);
    ChunkId last = get_u64(p + 8);
    for (ChunkId id = first; id <= last; id++)
      bm.insert(bm.end(), id);
  }
  out.swap(bm);
  return true;
}

std::vector<uint8_t> encode_request(ChunkId id) {
  std::vector<uint8_t> out;
  put_u64(out, id);
  return out;
}

bool decode_request(const std::vector<uint8_t> &payload, ChunkId &out) {
  if (payload.size() != 8)
    return false;
  out = get_u64(payload.data());
  return true;
}

std::vector<uint8_t> encode_handshake(NodeRole role, uint8_t flags) {
  return std::vector<uint8_t>{(uint8_t)role, flags};
}

bool decode_handshake(const std::vector<uint8_t> &payload, NodeRole &role,
                      uint8_t &flags) {
  // Bare handshakes from older nodes carry no payload.
  if (payload.empty()) {
    role = NodeRole::Viewer;
    flags = 0;
    return true;
  }
  if (payload.size() != 2 || payload[0] > (uint8_t)NodeRole::Origin)
    return false;
  role = (NodeRole)payload[0];
  flags = payload[1];
  return true;
}

std::vector<uint8_t> encode_ping(uint64_t stamp) {
  std::vector<uint8_t> out;
  put_u64(out, stamp);
  return out;
}

bool decode_ping(const std::vector<uint8_t> &payload, uint64_t &stamp) {
  if (payload.size() != 8)
    return false;
  stamp = get_u64(payload.data());
  return true;
}

std::vector<uint8_t> encode_stats_report(const StatsReport &r) {
  std::vector<uint8_t> out;
  out.reserve(17);
  out.push_back((uint8_t)r.role);
  put_u32(out, r.download_rate);
  put_u32(out, r.upload_rate);
  put_u16(out, r.buffered_frames);
  put_u16(out, r.peer_count);
  put_u32(out, r.avg_rtt_us);
  return out;
}

bool decode_stats_report(const std::vector<uint8_t> &payload,
                         StatsReport &out) {
  if (payload.size() != 17 || payload[0] > (uint8_t)NodeRole::Origin)
    return false;
  const uint8_t *p = payload.data();
  out.role = (NodeRole)p[0];
  out.download_rate = get_u32(p + 1);
  out.upload_rate = get_u32(p + 5);
  out.buffered_frames = get_u16(p + 9);
  out.peer_count = get_u16(p + 11);
  out.avg_rtt_us = get_u32(p + 13);
  return true;
}

std::vector<uint8_t> encode_peer_list(const std::vector<PeerEntry> &peers) {
  std::vector<uint8_t> out;
  size_t n = std::min(peers.size(), (size_t)0xFFFF);
  put_u16(out, (uint16_t)n);
  for (size_t i = 0; i < n; i++) {
    const auto &e = peers[i];
    uint8_t hl = (uint8_t)std::min(e.host.size(), (size_t)0xFF);
    out.push_back((uint8_t)e.role);
    out.push_back(hl);
    out.insert(out.end(), e.host.begin(), e.host.begin() + hl);
    put_u16(out, e.port);
  }
  return out;
}

bool decode_peer_list(const std::vector<uint8_t> &payload,
                      std::vector<PeerEntry> &out) {
  if (payload.size() < 2)
    return false;
  uint16_t count = get_u16(payload.data());
  size_t off = 2;
  std::vector<PeerEntry> entries;
  entries.reserve(count);
  for (uint16_t i = 0; i < count; i++) {
    if (payload.size() < off + 2)
      return false;
    uint8_t role = payload[off];
    uint8_t hl = payload[off + 1];
    if (role > (uint8_t)NodeRole::Origin || payload.size() < off + 2 + hl + 2)
      return false;
    PeerEntry e;
    e.role = (NodeRole)role;
    e.host.assign((const char *)payload.data() + off + 2, hl);
    e.port = get_u16(payload.data() + off + 2 + hl);
    entries.push_back(std::move(e));
    off += 2 + hl + 2;
  }
  if (off != payload.size())
    return false;
  out.swap(entries);
  return true;
}

} // namespace swarmcast
