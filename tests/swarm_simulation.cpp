#include "random.hpp"
#include "scheduler.hpp"
#include "source_distributor.hpp"

#include <cassert>
#include <chrono>
#include <map>
#include <memory>
#include <tuple>
#include <vector>

using namespace swarmcast;
using namespace std::chrono_literals;

// One origin and two viewers exchanging messages in memory, round by round.
namespace {

PeerAddress peer(uint16_t port) {
  return PeerAddress(asio::ip::make_address("127.0.0.1"), port);
}

struct SimNode {
  SimNode(uint16_t port, NodeRole r, PolicyKind policy)
      : addr(peer(port)), role(r),
        sched(make_policy(r == NodeRole::Origin ? PolicyKind::FloodPush : policy,
                          16)) {}
  PeerAddress addr;
  NodeRole role;
  ChunkStore store;
  PeerRegistry reg;
  Scheduler sched;
};

class Swarm {
public:
  explicit Swarm(PolicyKind policy) {
    nodes_.push_back(std::make_unique<SimNode>(1, NodeRole::Origin, policy));
    nodes_.push_back(std::make_unique<SimNode>(2, NodeRole::Viewer, policy));
    nodes_.push_back(std::make_unique<SimNode>(3, NodeRole::Viewer, policy));
    auto t = Clock::now();
    for (auto &a : nodes_)
      for (auto &b : nodes_)
        if (a != b)
          a->reg.on_handshake(b->addr, b->role, t);
    distributor_.admit(viewer_b().addr);
    distributor_.admit(viewer_c().addr);
    now_ = t;
  }

  SimNode &origin() { return *nodes_[0]; }
  SimNode &viewer_b() { return *nodes_[1]; }
  SimNode &viewer_c() { return *nodes_[2]; }

  void publish(ChunkId id) {
    origin().store.put(id, {(uint8_t)id});
    auto target = distributor_.next_target();
    assert(target);
    deliver(origin(), node(*target), id);
  }

  void round() {
    now_ += 100ms;
    for (auto &n : nodes_)
      for (auto &m : nodes_) {
        if (n == m)
          continue;
        m->sched.on_bitmap(n->addr, n->store.bitmap());
        m->reg.on_bitmap(n->addr, n->store.bitmap(), now_);
      }
    for (auto &n : nodes_) {
      for (auto &d : n->sched.plan_pulls(n->store, n->reg, 0, now_)) {
        requests_++;
        SimNode &holder = node(d.peer);
        holder.sched.on_request(n->addr, d.chunk, holder.store);
      }
    }
    for (auto &n : nodes_)
      for (auto &p : n->sched.peers_with_pending())
        for (auto &out : n->sched.drain(p, 32))
          deliver(*n, node(out.peer), out.chunk);
  }

  const std::map<std::tuple<uint16_t, uint16_t, ChunkId>, int> &deliveries() const {
    return deliveries_;
  }
  size_t requests() const { return requests_; }

private:
  SimNode &node(const PeerAddress &a) {
    for (auto &n : nodes_)
      if (n->addr == a)
        return *n;
    assert(false);
    return *nodes_[0];
  }

  void deliver(SimNode &src, SimNode &dst, ChunkId id) {
    assert(src.store.has(id));
    deliveries_[std::make_tuple(src.addr.port(), dst.addr.port(), id)]++;
    dst.reg.touch(src.addr, now_);
    if (!dst.store.put(id, *src.store.get(id)))
      return;
    dst.sched.on_chunk_stored(id);
    dst.sched.on_chunk_received(id, src.addr, dst.reg);
  }

  std::vector<std::unique_ptr<SimNode>> nodes_;
  SourceDistributor distributor_;
  Clock::time_point now_;
  std::map<std::tuple<uint16_t, uint16_t, ChunkId>, int> deliveries_;
  size_t requests_{0};
};

void run(PolicyKind policy) {
  Swarm swarm(policy);
  swarm.publish(1);
  swarm.publish(2);
  swarm.publish(3);

  // Round-robin seeding: B got 1 and 3, C got 2.
  assert((swarm.viewer_b().store.bitmap() == Bitmap{1, 3}));
  assert((swarm.viewer_c().store.bitmap() == Bitmap{2}));

  for (int i = 0; i < 5; i++)
    swarm.round();

  assert((swarm.viewer_b().store.bitmap() == Bitmap{1, 2, 3}));
  assert((swarm.viewer_c().store.bitmap() == Bitmap{1, 2, 3}));
  for (auto &kv : swarm.deliveries())
    assert(kv.second == 1);
  if (policy == PolicyKind::FloodPush)
    assert(swarm.requests() == 0);

  // Nothing is left queued once everyone is complete.
  assert(swarm.viewer_b().sched.peers_with_pending().empty());
  assert(swarm.viewer_c().sched.peers_with_pending().empty());
}

} // namespace

int main() {
  bool ok = random_init();
  assert(ok);
  (void)ok;
  run(PolicyKind::FloodPush);
  run(PolicyKind::RarestFirst);
  run(PolicyKind::EarliestDeadline);
  // Random holder choice differs run to run.
  for (int i = 0; i < 20; i++)
    run(PolicyKind::RarestFirst);
  return 0;
}
