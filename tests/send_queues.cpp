#include "random.hpp"
#include "scheduler.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <set>

using namespace swarmcast;
using namespace std::chrono_literals;

namespace {

PeerAddress peer(uint16_t port) {
  return PeerAddress(asio::ip::make_address("127.0.0.1"), port);
}

ChunkStore store_with(std::initializer_list<ChunkId> ids) {
  ChunkStore s;
  for (ChunkId id : ids)
    s.put(id, std::vector<uint8_t>{(uint8_t)id});
  return s;
}

Scheduler flood_scheduler() {
  return Scheduler(make_policy(PolicyKind::FloodPush, 16));
}

void pulls_before_pushes() {
  PeerRegistry reg;
  auto t0 = Clock::now();
  reg.on_handshake(peer(1), NodeRole::Viewer, t0);
  auto store = store_with({10, 11, 12});
  auto sched = flood_scheduler();

  assert(sched.enqueue_push(peer(1), 10, reg));
  assert(sched.enqueue_push(peer(1), 11, reg));
  assert(sched.on_request(peer(1), 12, store));
  assert(sched.pending_pull(peer(1)) == 1);
  assert(sched.pending_push(peer(1)) == 2);
  assert((sched.peers_with_pending() == std::vector<PeerAddress>{peer(1)}));

  auto out = sched.drain(peer(1), 32);
  assert(out.size() == 3);
  assert(out[0].chunk == 12 && out[0].pull);
  assert(out[1].chunk == 10 && !out[1].pull);
  assert(out[2].chunk == 11 && !out[2].pull);
  assert(sched.pending_pull(peer(1)) == 0);
  assert(sched.pending_push(peer(1)) == 0);
  assert(sched.peers_with_pending().empty());
  assert(sched.drain(peer(1), 32).empty());
  assert(sched.drain(peer(9), 32).empty());
}

void request_retires_push() {
  PeerRegistry reg;
  reg.on_handshake(peer(1), NodeRole::Viewer, Clock::now());
  auto store = store_with({10, 11});
  auto sched = flood_scheduler();

  assert(sched.enqueue_push(peer(1), 10, reg));
  assert(!sched.enqueue_push(peer(1), 10, reg));
  assert(sched.is_push_queued(peer(1), 10));
  assert(sched.on_request(peer(1), 10, store));
  assert(!sched.is_push_queued(peer(1), 10));
  // A repeated request does not queue the chunk twice.
  assert(sched.on_request(peer(1), 10, store));
  assert(sched.pending_pull(peer(1)) == 1);
  // Nor can a push sneak in behind the pull.
  assert(!sched.enqueue_push(peer(1), 10, reg));

  auto out = sched.drain(peer(1), 32);
  assert(out.size() == 1 && out[0].chunk == 10 && out[0].pull);

  assert(!sched.on_request(peer(1), 99, store));
  assert(sched.pending_pull(peer(1)) == 0);
}

void no_push_to_holders() {
  PeerRegistry reg;
  auto t0 = Clock::now();
  reg.on_bitmap(peer(1), Bitmap{10}, t0);
  auto sched = flood_scheduler();

  assert(!sched.enqueue_push(peer(1), 10, reg));
  assert(!sched.enqueue_push(peer(7), 10, reg)); // unknown peer
  assert(sched.enqueue_push(peer(1), 11, reg));
  assert(sched.enqueue_push(peer(1), 12, reg));

  // The peer got 11 elsewhere; it must not be sent again.
  Bitmap now_holds{10, 11};
  sched.on_bitmap(peer(1), now_holds);
  reg.on_bitmap(peer(1), now_holds, t0);
  assert(!sched.is_push_queued(peer(1), 11));
  assert(sched.is_push_queued(peer(1), 12));
  auto out = sched.drain(peer(1), 32);
  assert(out.size() == 1 && out[0].chunk == 12);
}

void flood_from_origin_only() {
  PeerRegistry reg;
  auto t0 = Clock::now();
  reg.on_handshake(peer(1), NodeRole::Origin, t0);
  reg.on_handshake(peer(2), NodeRole::Viewer, t0);
  reg.on_handshake(peer(3), NodeRole::Viewer, t0);
  reg.on_handshake(peer(4), NodeRole::Viewer, t0);
  reg.on_bitmap(peer(3), Bitmap{5}, t0);
  auto sched = flood_scheduler();

  // Received from the origin: forwarded to viewers lacking it, never back.
  assert(sched.on_chunk_received(5, peer(1), reg) == 2);
  assert(sched.is_push_queued(peer(2), 5));
  assert(!sched.is_push_queued(peer(3), 5));
  assert(sched.is_push_queued(peer(4), 5));
  assert(sched.pending_push(peer(1)) == 0);

  // Received from a viewer: no further flooding.
  assert(sched.on_chunk_received(6, peer(2), reg) == 0);
  assert(sched.on_chunk_received(7, peer(9), reg) == 0);

  // A second copy from the origin queues nothing new.
  assert(sched.on_chunk_received(5, peer(1), reg) == 0);
}

void push_budget_and_drop() {
  PeerRegistry reg;
  reg.on_handshake(peer(1), NodeRole::Viewer, Clock::now());
  auto sched = flood_scheduler();
  for (ChunkId id = 1; id <= 5; id++)
    sched.enqueue_push(peer(1), id, reg);

  auto out = sched.drain(peer(1), 2);
  assert(out.size() == 2 && out[0].chunk == 1 && out[1].chunk == 2);
  assert(sched.pending_push(peer(1)) == 3);
  assert(sched.drain(peer(1), 0).empty());

  sched.drop_peer(peer(1));
  assert(sched.pending_push(peer(1)) == 0);
  assert(sched.peers_with_pending().empty());
}

void in_flight_limit_and_timeout() {
  PeerRegistry reg;
  auto t0 = Clock::now();
  Bitmap adv;
  for (ChunkId id = 1; id <= 10; id++)
    adv.insert(id);
  reg.on_bitmap(peer(1), adv, t0);

  SchedulerConfig cfg;
  cfg.max_in_flight = 2;
  cfg.request_timeout = 1s;
  Scheduler sched(make_policy(PolicyKind::RarestFirst, 16), cfg);
  ChunkStore store;

  auto pulls = sched.plan_pulls(store, reg, 0, t0);
  assert(pulls.size() == 2);
  assert(pulls[0].chunk == 1 && pulls[1].chunk == 2);
  assert(sched.in_flight(peer(1)) == 2);
  assert(sched.plan_pulls(store, reg, 0, t0).empty());

  // Arrival frees a slot; the outstanding chunk is not asked for again.
  store.put(1, {1});
  sched.on_chunk_stored(1);
  assert(sched.in_flight(peer(1)) == 1);
  pulls = sched.plan_pulls(store, reg, 0, t0 + 100ms);
  assert(pulls.size() == 1 && pulls[0].chunk == 3);

  // Unanswered requests expire and become eligible again.
  pulls = sched.plan_pulls(store, reg, 0, t0 + 2s);
  assert(pulls.size() == 2);
  assert(pulls[0].chunk == 2 && pulls[1].chunk == 3);
}

void pulls_per_tick_cap() {
  PeerRegistry reg;
  auto t0 = Clock::now();
  Bitmap adv;
  for (ChunkId id = 100; id < 130; id++)
    adv.insert(id);
  reg.on_bitmap(peer(1), adv, t0);
  reg.on_bitmap(peer(2), adv, t0);

  Scheduler sched(make_policy(PolicyKind::EarliestDeadline, 16));
  ChunkStore store;
  auto pulls = sched.plan_pulls(store, reg, 0, t0);
  assert(pulls.size() == sched.config().max_pulls_per_tick);
  std::set<ChunkId> distinct;
  for (auto &d : pulls)
    distinct.insert(d.chunk);
  assert(distinct.size() == pulls.size());
  assert(*distinct.begin() == 100);
  assert(sched.in_flight(peer(1)) + sched.in_flight(peer(2)) == pulls.size());

  // The flood policy plans nothing.
  auto flood = flood_scheduler();
  assert(flood.plan_pulls(store, reg, 0, t0).empty());
}

} // namespace

int main() {
  bool ok = random_init();
  assert(ok);
  (void)ok;
  pulls_before_pushes();
  request_retires_push();
  no_push_to_holders();
  flood_from_origin_only();
  push_budget_and_drop();
  in_flight_limit_and_timeout();
  pulls_per_tick_cap();
  return 0;
}
