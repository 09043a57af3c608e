#include "source_distributor.hpp"

#include <cassert>
#include <map>

using namespace swarmcast;

namespace {

PeerAddress peer(uint16_t port) {
  return PeerAddress(asio::ip::make_address("127.0.0.1"), port);
}

void admission_lists() {
  SourceDistributor d;
  assert(!d.next_target());

  assert(d.admit(peer(1)).empty());
  auto second = d.admit(peer(2));
  assert((second == std::vector<PeerAddress>{peer(1)}));
  auto third = d.admit(peer(3));
  assert((third == std::vector<PeerAddress>{peer(1), peer(2)}));

  // A repeat handshake gets the others again but is not added twice.
  auto again = d.admit(peer(2));
  assert((again == std::vector<PeerAddress>{peer(1), peer(3)}));
  assert(d.roster().size() == 3);
  assert(d.contains(peer(3)));
  assert(!d.contains(peer(4)));
}

void fair_share() {
  const size_t n = 7;
  const size_t m = 1000;
  SourceDistributor d;
  for (uint16_t p = 1; p <= n; p++)
    d.admit(peer(p));

  std::map<uint16_t, size_t> got;
  for (size_t i = 0; i < m; i++) {
    auto t = d.next_target();
    assert(t);
    got[t->port()]++;
  }
  assert(got.size() == n);
  for (auto &kv : got)
    assert(kv.second == m / n || kv.second == m / n + 1);
}

void strict_rotation() {
  SourceDistributor d;
  d.admit(peer(1));
  d.admit(peer(2));
  d.admit(peer(3));
  assert(*d.next_target() == peer(1));
  assert(*d.next_target() == peer(2));
  assert(*d.next_target() == peer(3));
  assert(*d.next_target() == peer(1));
  assert(d.cursor() == 1);
}

void join_and_leave() {
  SourceDistributor d;
  d.admit(peer(1));
  d.admit(peer(2));
  d.admit(peer(3));
  d.next_target(); // 1
  d.next_target(); // 2, cursor now on 3

  // Removing a member before the cursor keeps 3 as next.
  assert(d.remove(peer(1)));
  assert(*d.next_target() == peer(3));
  assert(*d.next_target() == peer(2));

  // Removing the member under the cursor moves on to its successor.
  d.admit(peer(4)); // roster 2, 3, 4; cursor on 3
  assert(d.remove(peer(3)));
  assert(*d.next_target() == peer(4));
  assert(*d.next_target() == peer(2));

  // Removing the last member wraps the cursor.
  assert(d.remove(peer(4)));
  assert(*d.next_target() == peer(2));
  assert(!d.remove(peer(4)));

  assert(d.remove(peer(2)));
  assert(d.roster().empty());
  assert(!d.next_target());

  // A newcomer joins the rotation from then on.
  d.admit(peer(5));
  assert(*d.next_target() == peer(5));
  assert(*d.next_target() == peer(5));
}

} // namespace

int main() {
  admission_lists();
  fair_share();
  strict_rotation();
  join_and_leave();
  return 0;
}
