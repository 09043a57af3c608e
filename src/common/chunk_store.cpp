
#include "chunk_store.hpp"

namespace swarmcast {

bool ChunkStore::put(ChunkId id, std::vector<uint8_t> payload) {
  auto res = chunks_.emplace(id, std::move(payload));
  if (!res.second)
    return false;
  bytes_ += res.first->second.size();
  bitmap_.insert(id);
  return true;
}

const std::vector<uint8_t> *ChunkStore::get(ChunkId id) const {
  auto it = chunks_.find(id);
  if (it == chunks_.end())
    return nullptr;
  return &it->second;
}

size_t ChunkStore::evict_below(ChunkId bound) {
  size_t n = 0;
  auto end = bitmap_.lower_bound(bound);
  for (auto it = bitmap_.begin(); it != end; ++it) {
    auto c = chunks_.find(*it);
    bytes_ -= c->second.size();
    chunks_.erase(c);
    n++;
  }
  bitmap_.erase(bitmap_.begin(), end);
  return n;
}

std::optional<ChunkId> ChunkStore::lowest() const {
  if (bitmap_.empty())
    return std::nullopt;
  return *bitmap_.begin();
}

std::optional<ChunkId> ChunkStore::highest() const {
  if (bitmap_.empty())
    return std::nullopt;
  return *bitmap_.rbegin();
}

std::string ChunkStore::summary() const {
  if (bitmap_.empty())
    return "0 chunks";
  return std::to_string(bitmap_.size()) + " chunks (" +
         std::to_string(*bitmap_.begin()) + "-" +
         std::to_string(*bitmap_.rbegin()) + ")";
}

} // namespace swarmcast
