
#pragma once
#include <optional>
#include <vector>
#include "peer_registry.hpp"

namespace swarmcast {

// Origin-side admission and round-robin seeding: every new chunk goes to
// exactly one roster member, so peers must fetch the rest from each other.
class SourceDistributor {
public:
    // Returns the neighbor list to hand the newcomer (its initial neighbor
    // set, excluding itself) and appends it to the roster if absent.
    std::vector<PeerAddress> admit(const PeerAddress& newcomer);
    bool remove(const PeerAddress& peer);

    // roster[cursor], then cursor advances; nullopt on an empty roster.
    std::optional<PeerAddress> next_target();

    const std::vector<PeerAddress>& roster() const { return roster_; }
    size_t cursor() const { return cursor_; }
    bool contains(const PeerAddress& peer) const;

private:
    std::vector<PeerAddress> roster_;
    size_t cursor_{0};
};

} // namespace swarmcast
