
#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "chunk_store.hpp"
#include "peer_registry.hpp"
#include "protocol.hpp"

namespace swarmcast {

enum class PolicyKind { FloodPush, RarestFirst, EarliestDeadline };

bool parse_policy(const std::string& s, PolicyKind& out);
const char* policy_str(PolicyKind k);

struct PullDecision {
    PeerAddress peer;
    ChunkId chunk{0};
};

// Chunk ids >= cursor that are missing from `local` and advertised by at
// least one peer, ascending, at most `limit` of them.
std::vector<ChunkId> pull_candidates(const Bitmap& local, const PeerViews& peers,
                                     ChunkId cursor, size_t limit);
size_t availability(ChunkId id, const PeerViews& peers);

class SelectionPolicy {
public:
    virtual ~SelectionPolicy() = default;
    virtual PolicyKind kind() const = 0;
    virtual std::optional<PullDecision> select_next_pull(const Bitmap& local,
                                                         const PeerViews& peers,
                                                         ChunkId playback_cursor) const = 0;
};

// Never pulls; dissemination relies on the flood hook alone.
class FloodPushPolicy : public SelectionPolicy {
public:
    PolicyKind kind() const override { return PolicyKind::FloodPush; }
    std::optional<PullDecision> select_next_pull(const Bitmap&, const PeerViews&,
                                                 ChunkId) const override {
        return std::nullopt;
    }
};

// Least available chunk among the first `window` candidates, lowest id on
// ties, fetched from a uniformly random holder.
class RarestFirstPolicy : public SelectionPolicy {
public:
    explicit RarestFirstPolicy(size_t window = 16) : window_(window) {}
    PolicyKind kind() const override { return PolicyKind::RarestFirst; }
    std::optional<PullDecision> select_next_pull(const Bitmap& local, const PeerViews& peers,
                                                 ChunkId playback_cursor) const override;
private:
    size_t window_;
};

// First candidate at or after the cursor, regardless of scarcity.
class EarliestDeadlinePolicy : public SelectionPolicy {
public:
    PolicyKind kind() const override { return PolicyKind::EarliestDeadline; }
    std::optional<PullDecision> select_next_pull(const Bitmap& local, const PeerViews& peers,
                                                 ChunkId playback_cursor) const override;
};

std::unique_ptr<SelectionPolicy> make_policy(PolicyKind kind, size_t window);

struct SchedulerConfig {
    size_t max_in_flight{8};
    Clock::duration request_timeout{std::chrono::seconds(1)};
    size_t max_pulls_per_tick{5};
    size_t push_burst{32};
};

struct Outbound {
    PeerAddress peer;
    ChunkId chunk{0};
    bool pull{false};
};

// Owns the per-peer outbound queues. pending_pull holds chunks a peer asked
// us for, pending_push chunks we forward unasked; pulls always go first.
class Scheduler {
public:
    Scheduler(std::unique_ptr<SelectionPolicy> policy, SchedulerConfig cfg = SchedulerConfig{});

    const SelectionPolicy& policy() const { return *policy_; }
    const SchedulerConfig& config() const { return cfg_; }

    // Flood hook: a chunk that came straight from the origin is queued for
    // every other viewer that does not advertise it. Returns peers queued.
    size_t on_chunk_received(ChunkId id, const PeerAddress& from, const PeerRegistry& peers);
    bool enqueue_push(const PeerAddress& peer, ChunkId id, const PeerRegistry& peers);

    // Queues a pull response, retiring any queued push of the same chunk.
    // False when the chunk is not held locally.
    bool on_request(const PeerAddress& peer, ChunkId id, const ChunkStore& store);

    void on_bitmap(const PeerAddress& peer, const Bitmap& bm);
    void on_chunk_stored(ChunkId id);

    std::vector<PullDecision> plan_pulls(const ChunkStore& store, const PeerRegistry& peers,
                                         ChunkId playback_cursor, Clock::time_point now);

    // One send opportunity for a peer: all pulls, then up to push_budget pushes.
    std::vector<Outbound> drain(const PeerAddress& peer, size_t push_budget);
    std::vector<PeerAddress> peers_with_pending() const;

    void drop_peer(const PeerAddress& peer);

    size_t pending_pull(const PeerAddress& peer) const;
    size_t pending_push(const PeerAddress& peer) const;
    size_t in_flight(const PeerAddress& peer) const;
    bool is_push_queued(const PeerAddress& peer, ChunkId id) const;

private:
    struct PeerQueues {
        std::deque<ChunkId> pull;
        std::deque<ChunkId> push;
        std::map<ChunkId, Clock::time_point> requested;
    };

    const PeerQueues* queues(const PeerAddress& peer) const;
    void expire_requests(Clock::time_point now);

    std::unique_ptr<SelectionPolicy> policy_;
    SchedulerConfig cfg_;
    std::map<PeerAddress, PeerQueues> queues_;
};

} // namespace swarmcast
