
#include "source_distributor.hpp"
#include "logging.hpp"
#include <algorithm>

namespace swarmcast {

std::vector<PeerAddress> SourceDistributor::admit(const PeerAddress &newcomer) {
  std::vector<PeerAddress> neighbors;
  neighbors.reserve(roster_.size());
  for (auto &p : roster_)
    if (p != newcomer)
      neighbors.push_back(p);
  if (!contains(newcomer)) {
    roster_.push_back(newcomer);
    Logger::instance().log(LogLevel::INFO, "roster: %s joined (%zu members)",
                           endpoint_str(newcomer).c_str(), roster_.size());
  }
  return neighbors;
}

bool SourceDistributor::remove(const PeerAddress &peer) {
  auto it = std::find(roster_.begin(), roster_.end(), peer);
  if (it == roster_.end())
    return false;
  size_t idx = (size_t)(it - roster_.begin());
  roster_.erase(it);
  // Keep pointing at the member that would have been served next.
  if (idx < cursor_)
    cursor_--;
  if (cursor_ >= roster_.size())
    cursor_ = 0;
  Logger::instance().log(LogLevel::INFO, "roster: %s left (%zu members)",
                         endpoint_str(peer).c_str(), roster_.size());
  return true;
}

std::optional<PeerAddress> SourceDistributor::next_target() {
  if (roster_.empty())
    return std::nullopt;
  if (cursor_ >= roster_.size())
    cursor_ = 0;
  PeerAddress target = roster_[cursor_];
  cursor_ = (cursor_ + 1) % roster_.size();
  return target;
}

bool SourceDistributor::contains(const PeerAddress &peer) const {
  return std::find(roster_.begin(), roster_.end(), peer) != roster_.end();
}

} // namespace swarmcast
