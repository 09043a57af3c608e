#pragma once
#include <asio.hpp>
#include <array>
#include <chrono>
#include <deque>
#include <memory>
#include <functional>
#include "chunk_store.hpp"
#include "fragmenter.hpp"
#include "peer_registry.hpp"
#include "protocol.hpp"
#include "scheduler.hpp"
#include "source_distributor.hpp"
#include "stats.hpp"

namespace swarmcast {

struct NodeConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{0};
    NodeRole role{NodeRole::Viewer};
    PolicyKind policy{PolicyKind::RarestFirst};
    std::chrono::milliseconds heartbeat_period{2000};
    std::chrono::milliseconds bitmap_period{1000};
    std::chrono::milliseconds prune_period{5000};
    std::chrono::milliseconds dead_threshold{5000};
    std::chrono::milliseconds tick_period{100};
    std::chrono::milliseconds pex_period{5000};
    std::chrono::milliseconds stats_period{3000};
    size_t window{16};
    SchedulerConfig sched;
    uint32_t horizon_frames{300};
    size_t max_bitmap_ranges{50};
    size_t max_fragment_size{kMaxFragmentSize};
    size_t max_assemblies{64};
};

// One overlay participant on a single UDP socket. Every periodic task is a
// steady_timer on the caller's io_context; run that context on one thread.
class Node {
public:
    using udp = asio::ip::udp;
    using FrameHandler = std::function<void(const CompletedFrame&)>;

    Node(asio::io_context& io, const NodeConfig& cfg);
    ~Node();

    bool start();
    void stop();

    void connect_to(const udp::endpoint& ep);
    // Capture adapter entry point, origin only.
    bool publish_frame(const std::vector<uint8_t>& frame);
    // Stores a chunk as locally produced without seeding it.
    bool store_chunk(const Chunk& c);

    void set_frame_handler(FrameHandler h) { on_frame_ = std::move(h); }
    void set_stats_listener(NodeStats::Listener l) { stats_.set_listener(std::move(l)); }

    udp::endpoint local_endpoint() const;
    NodeRole role() const { return cfg_.role; }
    ChunkId playback_cursor() const;
    const ChunkStore& store() const { return store_; }
    const PeerRegistry& peers() const { return peers_; }
    const SourceDistributor& roster() const { return distributor_; }
    const StatsSnapshot& stats() const { return stats_.snapshot(); }

private:
    void do_receive();
    void do_send();
    void arm(asio::steady_timer& t, std::chrono::milliseconds period, void (Node::*fn)());

    void handle_datagram(const udp::endpoint& from, const uint8_t* data, size_t n);
    void handle_handshake(const udp::endpoint& from, const Packet& pkt);
    void handle_bitmap(const udp::endpoint& from, const Packet& pkt);
    void handle_request(const udp::endpoint& from, const Packet& pkt);
    void handle_data(const udp::endpoint& from, const Packet& pkt);
    void handle_peer_list(const udp::endpoint& from, const Packet& pkt);
    void handle_ping(const udp::endpoint& from, const Packet& pkt);
    void handle_stats_report(const udp::endpoint& from, const Packet& pkt);
    void on_peer_admitted(const udp::endpoint& peer, NodeRole peer_role);
    void malformed(const udp::endpoint& from, const char* what);

    void send_packet(const udp::endpoint& to, MsgType type, std::vector<uint8_t> payload);
    void send_handshake(const udp::endpoint& to, bool reply_requested);
    void send_bitmap(const udp::endpoint& to);
    void send_peer_list(const udp::endpoint& to, const std::vector<udp::endpoint>& list);
    void send_chunk(const udp::endpoint& to, ChunkId id);
    void flush_peer(const udp::endpoint& peer, size_t push_budget);
    void evict_before_frame(uint32_t newest_frame);

    void heartbeat_task();
    void bitmap_task();
    void prune_task();
    void schedule_task();
    void pex_task();
    void stats_task();

    NodeConfig cfg_;
    udp::socket socket_;
    std::array<uint8_t, 65536> recv_buf_{};
    udp::endpoint recv_from_;
    std::deque<std::pair<udp::endpoint, std::vector<uint8_t>>> send_q_;
    bool sending_{false};
    bool running_{false};
    // Handlers already queued when the node dies see this expired.
    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};

    asio::steady_timer heartbeat_timer_;
    asio::steady_timer bitmap_timer_;
    asio::steady_timer prune_timer_;
    asio::steady_timer tick_timer_;
    asio::steady_timer pex_timer_;
    asio::steady_timer stats_timer_;

    ChunkStore store_;
    PeerRegistry peers_;
    Scheduler scheduler_;
    SourceDistributor distributor_;
    Fragmenter fragmenter_;
    Reassembler reassembler_;
    NodeStats stats_;
    FrameHandler on_frame_;

    uint32_t next_seq_{0};
    uint32_t next_frame_id_{1};
};

} // namespace swarmcast
