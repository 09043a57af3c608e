
#pragma once
#include <asio.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace swarmcast {

using Clock = std::chrono::steady_clock;
using PeerAddress = asio::ip::udp::endpoint;

std::string endpoint_str(const PeerAddress& ep);

struct PeerInfo {
    PeerAddress address;
    NodeRole role{NodeRole::Viewer};
    bool handshaken{false};
    Clock::time_point last_seen{};
    Bitmap remote_bitmap;
    // Latest PING round trip; zero until the first PONG.
    Clock::duration rtt{0};
};

// Read-only view handed to selection policies.
struct PeerView {
    PeerAddress address;
    const Bitmap* remote_bitmap{nullptr};
};
using PeerViews = std::vector<PeerView>;

// Owns neighbor liveness and the last advertised bitmap of each neighbor.
// Every entry point admits unknown senders; the bool result reports
// whether the peer is new.
class PeerRegistry {
public:
    bool on_handshake(const PeerAddress& addr, NodeRole role, Clock::time_point now);
    bool on_heartbeat(const PeerAddress& addr, Clock::time_point now);
    // Latest wins: the previous bitmap is replaced, not merged.
    bool on_bitmap(const PeerAddress& addr, Bitmap bm, Clock::time_point now);
    bool touch(const PeerAddress& addr, Clock::time_point now);
    bool on_pong(const PeerAddress& addr, Clock::duration rtt, Clock::time_point now);
    void set_role(const PeerAddress& addr, NodeRole role);

    // Drops peers silent for longer than threshold and returns them.
    std::vector<PeerAddress> prune_dead(Clock::time_point now, Clock::duration threshold);
    bool remove(const PeerAddress& addr);

    const PeerInfo* find(const PeerAddress& addr) const;
    bool contains(const PeerAddress& addr) const { return peers_.count(addr) != 0; }
    bool holds(const PeerAddress& addr, ChunkId id) const;
    const std::map<PeerAddress, PeerInfo>& peers() const { return peers_; }
    size_t size() const { return peers_.size(); }
    bool empty() const { return peers_.empty(); }

    PeerViews views() const;
    std::vector<PeerAddress> addresses() const;
    // Number of distinct chunk ids advertised across all neighbors.
    size_t remote_union_size() const;
    // Mean over peers with a measured RTT, zero when none has one.
    Clock::duration average_rtt() const;

private:
    PeerInfo& upsert(const PeerAddress& addr, Clock::time_point now, bool& created);

    std::map<PeerAddress, PeerInfo> peers_;
};

} // namespace swarmcast
