
#include "scheduler.hpp"
#include "logging.hpp"
#include "random.hpp"
#include <algorithm>

namespace swarmcast {

namespace {

bool contains(const std::deque<ChunkId> &q, ChunkId id) {
  return std::find(q.begin(), q.end(), id) != q.end();
}

bool erase_one(std::deque<ChunkId> &q, ChunkId id) {
  auto it = std::find(q.begin(), q.end(), id);
  if (it == q.end())
    return false;
  q.erase(it);
  return true;
}

std::optional<PullDecision> pick_holder(ChunkId id, const PeerViews &peers) {
  std::vector<const PeerView *> owners;
  for (auto &p : peers)
    if (p.remote_bitmap && p.remote_bitmap->count(id))
      owners.push_back(&p);
  if (owners.empty())
    return std::nullopt;
  auto *o = owners[random_uniform((uint32_t)owners.size())];
  return PullDecision{o->address, id};
}

} // namespace

bool parse_policy(const std::string &s, PolicyKind &out) {
  if (s == "push" || s == "flood" || s == "default")
    out = PolicyKind::FloodPush;
  else if (s == "rarest")
    out = PolicyKind::RarestFirst;
  else if (s == "edf")
    out = PolicyKind::EarliestDeadline;
  else
    return false;
  return true;
}

const char *policy_str(PolicyKind k) {
  switch (k) {
  case PolicyKind::FloodPush:
    return "flood-push";
  case PolicyKind::RarestFirst:
    return "rarest-first";
  default:
    return "edf";
  }
}

std::vector<ChunkId> pull_candidates(const Bitmap &local, const PeerViews &peers,
                                     ChunkId cursor, size_t limit) {
  Bitmap found;
  if (limit == 0)
    return {};
  // The global first `limit` are among each peer's first `limit`.
  for (auto &p : peers) {
    if (!p.remote_bitmap)
      continue;
    size_t taken = 0;
    for (auto it = p.remote_bitmap->lower_bound(cursor);
         it != p.remote_bitmap->end() && taken < limit; ++it) {
      if (local.count(*it))
        continue;
      found.insert(*it);
      taken++;
    }
  }
  std::vector<ChunkId> out;
  for (auto it = found.begin(); it != found.end() && out.size() < limit; ++it)
    out.push_back(*it);
  return out;
}

size_t availability(ChunkId id, const PeerViews &peers) {
  size_t n = 0;
  for (auto &p : peers)
    if (p.remote_bitmap && p.remote_bitmap->count(id))
      n++;
  return n;
}

std::optional<PullDecision>
RarestFirstPolicy::select_next_pull(const Bitmap &local, const PeerViews &peers,
                                    ChunkId playback_cursor) const {
  auto window = pull_candidates(local, peers, playback_cursor, window_);
  if (window.empty())
    return std::nullopt;
  ChunkId best = window.front();
  size_t best_avail = availability(best, peers);
  for (size_t i = 1; i < window.size(); i++) {
    size_t a = availability(window[i], peers);
    if (a < best_avail) {
      best = window[i];
      best_avail = a;
    }
  }
  return pick_holder(best, peers);
}

std::optional<PullDecision>
EarliestDeadlinePolicy::select_next_pull(const Bitmap &local,
                                         const PeerViews &peers,
                                         ChunkId playback_cursor) const {
  auto first = pull_candidates(local, peers, playback_cursor, 1);
  if (first.empty())
    return std::nullopt;
  return pick_holder(first.front(), peers);
}

std::unique_ptr<SelectionPolicy> make_policy(PolicyKind kind, size_t window) {
  switch (kind) {
  case PolicyKind::RarestFirst:
    return std::make_unique<RarestFirstPolicy>(window);
  case PolicyKind::EarliestDeadline:
    return std::make_unique<EarliestDeadlinePolicy>();
  default:
    return std::make_unique<FloodPushPolicy>();
  }
}

Scheduler::Scheduler(std::unique_ptr<SelectionPolicy> policy,
                     SchedulerConfig cfg)
    : policy_(std::move(policy)), cfg_(cfg) {
  if (!policy_)
    policy_ = std::make_unique<FloodPushPolicy>();
}

size_t Scheduler::on_chunk_received(ChunkId id, const PeerAddress &from,
                                    const PeerRegistry &peers) {
  auto src = peers.find(from);
  if (!src || src->role != NodeRole::Origin)
    return 0;
  size_t queued = 0;
  for (auto &kv : peers.peers()) {
    if (kv.first == from || kv.second.role == NodeRole::Origin)
      continue;
    if (enqueue_push(kv.first, id, peers))
      queued++;
  }
  if (queued)
    Logger::instance().log(LogLevel::TRACE, "flood: chunk %llu queued for %zu peers",
                           (unsigned long long)id, queued);
  return queued;
}

bool Scheduler::enqueue_push(const PeerAddress &peer, ChunkId id,
                             const PeerRegistry &peers) {
  if (!peers.contains(peer) || peers.holds(peer, id))
    return false;
  auto &q = queues_[peer];
  if (contains(q.push, id) || contains(q.pull, id))
    return false;
  q.push.push_back(id);
  return true;
}

bool Scheduler::on_request(const PeerAddress &peer, ChunkId id,
                           const ChunkStore &store) {
  if (!store.has(id))
    return false;
  auto &q = queues_[peer];
  if (erase_one(q.push, id))
    Logger::instance().log(LogLevel::DEBUG,
                           "chunk %llu for %s moved from push to pull",
                           (unsigned long long)id, endpoint_str(peer).c_str());
  if (!contains(q.pull, id))
    q.pull.push_back(id);
  return true;
}

void Scheduler::on_bitmap(const PeerAddress &peer, const Bitmap &bm) {
  auto it = queues_.find(peer);
  if (it == queues_.end())
    return;
  auto &push = it->second.push;
  push.erase(std::remove_if(push.begin(), push.end(),
                            [&bm](ChunkId id) { return bm.count(id) != 0; }),
             push.end());
}

void Scheduler::on_chunk_stored(ChunkId id) {
  for (auto &kv : queues_)
    kv.second.requested.erase(id);
}

void Scheduler::expire_requests(Clock::time_point now) {
  for (auto &kv : queues_) {
    auto &req = kv.second.requested;
    for (auto it = req.begin(); it != req.end();) {
      if (now - it->second >= cfg_.request_timeout)
        it = req.erase(it);
      else
        ++it;
    }
  }
}

std::vector<PullDecision> Scheduler::plan_pulls(const ChunkStore &store,
                                                const PeerRegistry &peers,
                                                ChunkId playback_cursor,
                                                Clock::time_point now) {
  std::vector<PullDecision> out;
  if (policy_->kind() == PolicyKind::FloodPush || peers.empty())
    return out;
  expire_requests(now);

  // Outstanding requests count as held so they are not asked for twice.
  Bitmap effective = store.bitmap();
  for (auto &kv : queues_)
    for (auto &r : kv.second.requested)
      effective.insert(r.first);

  PeerViews views;
  for (auto &v : peers.views()) {
    auto q = queues(v.address);
    if (!q || q->requested.size() < cfg_.max_in_flight)
      views.push_back(v);
  }

  while (out.size() < cfg_.max_pulls_per_tick && !views.empty()) {
    auto d = policy_->select_next_pull(effective, views, playback_cursor);
    if (!d)
      break;
    auto &q = queues_[d->peer];
    q.requested[d->chunk] = now;
    effective.insert(d->chunk);
    if (q.requested.size() >= cfg_.max_in_flight) {
      views.erase(std::remove_if(views.begin(), views.end(),
                                 [&d](const PeerView &v) {
                                   return v.address == d->peer;
                                 }),
                  views.end());
    }
    out.push_back(*d);
  }
  return out;
}

std::vector<Outbound> Scheduler::drain(const PeerAddress &peer,
                                       size_t push_budget) {
  std::vector<Outbound> out;
  auto it = queues_.find(peer);
  if (it == queues_.end())
    return out;
  auto &q = it->second;
  while (!q.pull.empty()) {
    out.push_back(Outbound{peer, q.pull.front(), true});
    q.pull.pop_front();
  }
  while (push_budget > 0 && !q.push.empty()) {
    out.push_back(Outbound{peer, q.push.front(), false});
    q.push.pop_front();
    push_budget--;
  }
  return out;
}

std::vector<PeerAddress> Scheduler::peers_with_pending() const {
  std::vector<PeerAddress> out;
  for (auto &kv : queues_)
    if (!kv.second.pull.empty() || !kv.second.push.empty())
      out.push_back(kv.first);
  return out;
}

void Scheduler::drop_peer(const PeerAddress &peer) { queues_.erase(peer); }

const Scheduler::PeerQueues *Scheduler::queues(const PeerAddress &peer) const {
  auto it = queues_.find(peer);
  return it == queues_.end() ? nullptr : &it->second;
}

size_t Scheduler::pending_pull(const PeerAddress &peer) const {
  auto q = queues(peer);
  return q ? q->pull.size() : 0;
}

size_t Scheduler::pending_push(const PeerAddress &peer) const {
  auto q = queues(peer);
  return q ? q->push.size() : 0;
}

size_t Scheduler::in_flight(const PeerAddress &peer) const {
  auto q = queues(peer);
  return q ? q->requested.size() : 0;
}

bool Scheduler::is_push_queued(const PeerAddress &peer, ChunkId id) const {
  auto q = queues(peer);
  return q && contains(q->push, id);
}

} // namespace swarmcast
