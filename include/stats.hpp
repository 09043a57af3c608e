
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include "protocol.hpp"

namespace swarmcast {

struct StatsSnapshot {
    uint64_t bytes_sent{0};
    uint64_t bytes_received{0};
    uint64_t packets_sent{0};
    uint64_t packets_received{0};
    uint64_t malformed_packets{0};
    uint64_t duplicate_chunks{0};
    uint64_t stale_fragments{0};
    uint64_t frames_published{0};
    uint64_t frames_emitted{0};
    uint64_t served_pull{0};
    uint64_t served_push{0};
    uint64_t requests_sent{0};
    size_t peer_count{0};
    size_t buffered_frames{0};
    size_t remote_chunks{0};
    double download_rate{0};  // bytes/s over the last rate window
    double upload_rate{0};
    double avg_rtt_ms{0};
    std::string local_bitmap;
    std::map<std::string, uint64_t> download_by_source;
    // Origin only: latest report from each viewer, keyed by address.
    std::map<std::string, StatsReport> peer_reports;
};

// One per node. Components report into it; readers only get snapshots.
class NodeStats {
public:
    using Listener = std::function<void(const StatsSnapshot&)>;

    void set_listener(Listener l) { listener_ = std::move(l); }

    void on_sent(size_t bytes);
    void on_received(size_t bytes);
    // Closes a rate window: rates are byte deltas since the previous call.
    void update_rates(std::chrono::steady_clock::time_point now);
    void set_avg_rtt(std::chrono::steady_clock::duration rtt);
    void record_peer_report(const std::string& source, const StatsReport& r);
    void drop_peer_report(const std::string& source);
    void on_chunk_downloaded(const std::string& source, size_t bytes);
    void on_malformed() { s_.malformed_packets++; }
    void on_duplicate_chunk() { s_.duplicate_chunks++; }
    void on_stale_fragment() { s_.stale_fragments++; }
    void on_frame_published() { s_.frames_published++; publish(); }
    void on_frame_emitted(size_t buffered);
    void on_served(bool pull) { pull ? s_.served_pull++ : s_.served_push++; }
    void on_request_sent() { s_.requests_sent++; }
    void set_peers(size_t peer_count, size_t remote_chunks);
    void set_buffered_frames(size_t n);
    void set_local_bitmap(std::string summary);

    const StatsSnapshot& snapshot() const { return s_; }
    std::string report_line() const;

private:
    void publish();

    StatsSnapshot s_;
    Listener listener_;
    bool rate_marked_{false};
    std::chrono::steady_clock::time_point rate_mark_{};
    uint64_t sent_at_mark_{0};
    uint64_t received_at_mark_{0};
};

} // namespace swarmcast
