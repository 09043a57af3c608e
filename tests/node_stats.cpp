#include "stats.hpp"

#include <cassert>
#include <chrono>
#include <string>

using namespace swarmcast;

int main() {
  NodeStats stats;
  int published = 0;
  StatsSnapshot last;
  stats.set_listener([&](const StatsSnapshot &s) {
    published++;
    last = s;
  });

  // Every traffic counter update reaches the listener.
  stats.on_sent(1200);
  assert(published == 1);
  assert(last.bytes_sent == 1200 && last.packets_sent == 1);
  stats.on_received(800);
  assert(published == 2);
  assert(last.bytes_received == 800 && last.packets_received == 1);

  stats.set_buffered_frames(4);
  assert(published == 3 && last.buffered_frames == 4);
  stats.set_buffered_frames(4);
  assert(published == 3);

  // Rates: the first window only sets the mark.
  using Clock = std::chrono::steady_clock;
  Clock::time_point t0{std::chrono::seconds(100)};
  stats.update_rates(t0);
  assert(published == 4);
  assert(last.upload_rate == 0 && last.download_rate == 0);
  stats.on_sent(1000);
  stats.on_received(3000);
  stats.update_rates(t0 + std::chrono::seconds(2));
  assert(last.upload_rate == 500.0);
  assert(last.download_rate == 1500.0);
  // An idle window drops back to zero.
  stats.update_rates(t0 + std::chrono::seconds(3));
  assert(last.upload_rate == 0 && last.download_rate == 0);

  stats.set_avg_rtt(std::chrono::microseconds(2500));
  assert(stats.snapshot().avg_rtt_ms == 2.5);

  StatsReport r;
  r.download_rate = 4096;
  r.peer_count = 3;
  int before = published;
  stats.record_peer_report("10.0.0.2:47000", r);
  assert(published == before + 1);
  assert(last.peer_reports.size() == 1);
  assert(last.peer_reports.at("10.0.0.2:47000").peer_count == 3);
  stats.drop_peer_report("10.0.0.9:47000");
  assert(published == before + 1);
  stats.drop_peer_report("10.0.0.2:47000");
  assert(published == before + 2);
  assert(last.peer_reports.empty());

  std::string line = stats.report_line();
  assert(line.find("rtt=2.5ms") != std::string::npos);
  assert(line.find("sent=2200") != std::string::npos);
  return 0;
}
