
#include "fragmenter.hpp"
#include "logging.hpp"
#include <algorithm>

namespace swarmcast {

std::vector<uint8_t> chunk_to_payload(const Chunk &c) {
  std::vector<uint8_t> out;
  encode_chunk_payload(c.hdr, c.data.data(), c.data.size(), out);
  return out;
}

bool chunk_from_payload(const std::vector<uint8_t> &payload, Chunk &out) {
  if (!decode_chunk_header(payload, out.hdr))
    return false;
  out.data.assign(payload.begin() + kChunkHeaderSize, payload.end());
  return true;
}

bool Fragmenter::split(const std::vector<uint8_t> &frame, uint32_t frame_id,
                       std::vector<Chunk> &out) const {
  out.clear();
  if (max_fragment_size_ == 0)
    return false;
  size_t total = frame.size();
  size_t frags = (total + max_fragment_size_ - 1) / max_fragment_size_;
  if (frags == 0)
    frags = 1;
  if (frags > kFragmentsPerFrame)
    return false;

  out.resize(frags);
  size_t offset = 0;
  for (size_t i = 0; i < frags; i++) {
    size_t n = std::min(max_fragment_size_, total - offset);
    Chunk &c = out[i];
    c.hdr.frame_id = frame_id;
    c.hdr.total_frags = (uint16_t)frags;
    c.hdr.fragment_index = (uint16_t)i;
    c.data.assign(frame.begin() + offset, frame.begin() + offset + n);
    offset += n;
  }
  return true;
}

std::optional<uint32_t> Reassembler::last_emitted() const {
  if (!has_emitted_)
    return std::nullopt;
  return last_emitted_;
}

std::optional<CompletedFrame> Reassembler::accept(const Chunk &c) {
  const ChunkHeader &h = c.hdr;
  if (is_stale(h.frame_id)) {
    dropped_stale_++;
    return std::nullopt;
  }
  if (h.total_frags == 0 || h.fragment_index >= h.total_frags) {
    dropped_invalid_++;
    return std::nullopt;
  }

  auto it = assemblies_.find(h.frame_id);
  if (it == assemblies_.end()) {
    // Keep the newest frames when too many are in flight.
    if (max_in_flight_ && assemblies_.size() >= max_in_flight_) {
      if (h.frame_id < assemblies_.begin()->first) {
        evicted_incomplete_++;
        return std::nullopt;
      }
      Logger::instance().log(LogLevel::DEBUG,
                             "reassembly: evicting incomplete frame %u",
                             assemblies_.begin()->first);
      assemblies_.erase(assemblies_.begin());
      evicted_incomplete_++;
    }
    Assembly a;
    a.total_frags = h.total_frags;
    a.fragments.resize(h.total_frags);
    a.present.assign(h.total_frags, false);
    it = assemblies_.emplace(h.frame_id, std::move(a)).first;
  }

  Assembly &a = it->second;
  if (a.total_frags != h.total_frags) {
    dropped_invalid_++;
    return std::nullopt;
  }
  if (a.present[h.fragment_index])
    return std::nullopt;
  a.fragments[h.fragment_index] = c.data;
  a.present[h.fragment_index] = true;
  a.received++;
  a.bytes += c.data.size();
  if (a.received < a.total_frags)
    return std::nullopt;

  CompletedFrame done;
  done.frame_id = h.frame_id;
  done.bytes.reserve(a.bytes);
  for (auto &f : a.fragments)
    done.bytes.insert(done.bytes.end(), f.begin(), f.end());

  has_emitted_ = true;
  last_emitted_ = h.frame_id;
  collect_up_to(h.frame_id);
  return done;
}

void Reassembler::collect_up_to(uint32_t frame_id) {
  auto end = assemblies_.upper_bound(frame_id);
  for (auto it = assemblies_.begin(); it != end; ++it) {
    if (it->first != frame_id)
      evicted_incomplete_++;
  }
  assemblies_.erase(assemblies_.begin(), end);
}

} // namespace swarmcast
