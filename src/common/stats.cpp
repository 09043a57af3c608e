
#include "stats.hpp"
#include <cstdio>

namespace swarmcast {

void NodeStats::on_sent(size_t bytes) {
  s_.bytes_sent += bytes;
  s_.packets_sent++;
  publish();
}

void NodeStats::on_received(size_t bytes) {
  s_.bytes_received += bytes;
  s_.packets_received++;
  publish();
}

void NodeStats::update_rates(std::chrono::steady_clock::time_point now) {
  if (rate_marked_ && now > rate_mark_) {
    double dt = std::chrono::duration<double>(now - rate_mark_).count();
    s_.upload_rate = (double)(s_.bytes_sent - sent_at_mark_) / dt;
    s_.download_rate = (double)(s_.bytes_received - received_at_mark_) / dt;
  }
  rate_marked_ = true;
  rate_mark_ = now;
  sent_at_mark_ = s_.bytes_sent;
  received_at_mark_ = s_.bytes_received;
  publish();
}

void NodeStats::set_avg_rtt(std::chrono::steady_clock::duration rtt) {
  s_.avg_rtt_ms = std::chrono::duration<double, std::milli>(rtt).count();
}

void NodeStats::record_peer_report(const std::string &source,
                                   const StatsReport &r) {
  s_.peer_reports[source] = r;
  publish();
}

void NodeStats::drop_peer_report(const std::string &source) {
  if (s_.peer_reports.erase(source))
    publish();
}

void NodeStats::set_buffered_frames(size_t n) {
  if (n == s_.buffered_frames)
    return;
  s_.buffered_frames = n;
  publish();
}

void NodeStats::on_chunk_downloaded(const std::string &source, size_t bytes) {
  s_.download_by_source[source] += bytes;
  publish();
}

void NodeStats::on_frame_emitted(size_t buffered) {
  s_.frames_emitted++;
  s_.buffered_frames = buffered;
  publish();
}

void NodeStats::set_peers(size_t peer_count, size_t remote_chunks) {
  bool changed = peer_count != s_.peer_count;
  s_.peer_count = peer_count;
  s_.remote_chunks = remote_chunks;
  if (changed)
    publish();
}

void NodeStats::set_local_bitmap(std::string summary) {
  s_.local_bitmap = std::move(summary);
  publish();
}

std::string NodeStats::report_line() const {
  char buf[384];
  std::snprintf(buf, sizeof(buf),
                "peers=%zu sent=%llu recv=%llu up=%.1fKB/s down=%.1fKB/s "
                "rtt=%.1fms frames=%llu/%llu buffered=%zu "
                "malformed=%llu stale=%llu dup=%llu",
                s_.peer_count, (unsigned long long)s_.bytes_sent,
                (unsigned long long)s_.bytes_received, s_.upload_rate / 1024,
                s_.download_rate / 1024, s_.avg_rtt_ms,
                (unsigned long long)s_.frames_emitted,
                (unsigned long long)s_.frames_published, s_.buffered_frames,
                (unsigned long long)s_.malformed_packets,
                (unsigned long long)s_.stale_fragments,
                (unsigned long long)s_.duplicate_chunks);
  return std::string(buf) + " bitmap=" + s_.local_bitmap;
}

void NodeStats::publish() {
  if (listener_)
    listener_(s_);
}

} // namespace swarmcast
