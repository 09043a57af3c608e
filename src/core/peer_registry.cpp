
#include "peer_registry.hpp"
#include "logging.hpp"

namespace swarmcast {

std::string endpoint_str(const PeerAddress &ep) {
  std::string host = ep.address().to_string();
  if (ep.address().is_v6())
    host = "[" + host + "]";
  return host + ":" + std::to_string(ep.port());
}

PeerInfo &PeerRegistry::upsert(const PeerAddress &addr, Clock::time_point now,
                               bool &created) {
  auto it = peers_.find(addr);
  created = it == peers_.end();
  if (created) {
    PeerInfo p;
    p.address = addr;
    it = peers_.emplace(addr, std::move(p)).first;
    Logger::instance().log(LogLevel::INFO, "peer %s admitted",
                           endpoint_str(addr).c_str());
  }
  it->second.last_seen = now;
  return it->second;
}

bool PeerRegistry::on_handshake(const PeerAddress &addr, NodeRole role,
                                Clock::time_point now) {
  bool created;
  PeerInfo &p = upsert(addr, now, created);
  p.role = role;
  p.handshaken = true;
  return created;
}

bool PeerRegistry::on_heartbeat(const PeerAddress &addr, Clock::time_point now) {
  bool created;
  upsert(addr, now, created);
  return created;
}

bool PeerRegistry::on_bitmap(const PeerAddress &addr, Bitmap bm,
                             Clock::time_point now) {
  bool created;
  PeerInfo &p = upsert(addr, now, created);
  p.remote_bitmap.swap(bm);
  return created;
}

bool PeerRegistry::touch(const PeerAddress &addr, Clock::time_point now) {
  bool created;
  upsert(addr, now, created);
  return created;
}

bool PeerRegistry::on_pong(const PeerAddress &addr, Clock::duration rtt,
                           Clock::time_point now) {
  bool created;
  PeerInfo &p = upsert(addr, now, created);
  p.rtt = rtt;
  return created;
}

void PeerRegistry::set_role(const PeerAddress &addr, NodeRole role) {
  auto it = peers_.find(addr);
  if (it != peers_.end())
    it->second.role = role;
}

std::vector<PeerAddress> PeerRegistry::prune_dead(Clock::time_point now,
                                                  Clock::duration threshold) {
  std::vector<PeerAddress> dead;
  for (auto it = peers_.begin(); it != peers_.end();) {
    if (now - it->second.last_seen > threshold) {
      dead.push_back(it->first);
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return dead;
}

bool PeerRegistry::remove(const PeerAddress &addr) {
  return peers_.erase(addr) != 0;
}

const PeerInfo *PeerRegistry::find(const PeerAddress &addr) const {
  auto it = peers_.find(addr);
  return it == peers_.end() ? nullptr : &it->second;
}

bool PeerRegistry::holds(const PeerAddress &addr, ChunkId id) const {
  auto p = find(addr);
  return p && p->remote_bitmap.count(id) != 0;
}

PeerViews PeerRegistry::views() const {
  PeerViews v;
  v.reserve(peers_.size());
  for (auto &kv : peers_)
    v.push_back(PeerView{kv.first, &kv.second.remote_bitmap});
  return v;
}

std::vector<PeerAddress> PeerRegistry::addresses() const {
  std::vector<PeerAddress> out;
  out.reserve(peers_.size());
  for (auto &kv : peers_)
    out.push_back(kv.first);
  return out;
}

size_t PeerRegistry::remote_union_size() const {
  Bitmap all;
  for (auto &kv : peers_)
    all.insert(kv.second.remote_bitmap.begin(), kv.second.remote_bitmap.end());
  return all.size();
}

Clock::duration PeerRegistry::average_rtt() const {
  Clock::duration total{0};
  size_t n = 0;
  for (auto &kv : peers_) {
    if (kv.second.rtt <= Clock::duration::zero())
      continue;
    total += kv.second.rtt;
    n++;
  }
  return n ? total / (Clock::rep)n : Clock::duration::zero();
}

} // namespace swarmcast
