#include "node.hpp"
#include "logging.hpp"
#include "random.hpp"
#include <algorithm>
#include <memory>

namespace swarmcast {

namespace {

double wall_seconds() {
  using namespace std::chrono;
  return duration<double>(system_clock::now().time_since_epoch()).count();
}

} // namespace

Node::Node(asio::io_context &io, const NodeConfig &cfg)
    : cfg_(cfg), socket_(io), heartbeat_timer_(io), bitmap_timer_(io),
      prune_timer_(io), tick_timer_(io), pex_timer_(io), stats_timer_(io),
      scheduler_(make_policy(cfg.role == NodeRole::Origin ? PolicyKind::FloodPush
                                                          : cfg.policy,
                             cfg.window),
                 cfg.sched),
      fragmenter_(cfg.max_fragment_size), reassembler_(cfg.max_assemblies) {
  next_seq_ = random_u32();
}

Node::~Node() { stop(); }

bool Node::start() {
  std::error_code ec;
  auto addr = asio::ip::make_address(cfg_.listen_host, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "bad listen address %s: %s",
                           cfg_.listen_host.c_str(), ec.message().c_str());
    return false;
  }
  udp::endpoint ep(addr, cfg_.listen_port);
  socket_.open(ep.protocol(), ec);
  if (!ec)
    socket_.bind(ep, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "bind %s failed: %s",
                           endpoint_str(ep).c_str(), ec.message().c_str());
    std::error_code ec2;
    socket_.close(ec2);
    return false;
  }
  running_ = true;
  Logger::instance().log(LogLevel::INFO, "%s node on %s, policy %s",
                         role_str(cfg_.role),
                         endpoint_str(local_endpoint()).c_str(),
                         policy_str(scheduler_.policy().kind()));
  do_receive();
  arm(heartbeat_timer_, cfg_.heartbeat_period, &Node::heartbeat_task);
  arm(bitmap_timer_, cfg_.bitmap_period, &Node::bitmap_task);
  arm(prune_timer_, cfg_.prune_period, &Node::prune_task);
  arm(tick_timer_, cfg_.tick_period, &Node::schedule_task);
  arm(pex_timer_, cfg_.pex_period, &Node::pex_task);
  arm(stats_timer_, cfg_.stats_period, &Node::stats_task);
  return true;
}

void Node::stop() {
  if (!running_)
    return;
  running_ = false;
  heartbeat_timer_.cancel();
  bitmap_timer_.cancel();
  prune_timer_.cancel();
  tick_timer_.cancel();
  pex_timer_.cancel();
  stats_timer_.cancel();
  std::error_code ec;
  socket_.close(ec);
  // An outstanding send owns its own buffer, so the queue can go now.
  send_q_.clear();
  sending_ = false;
  Logger::instance().log(LogLevel::INFO, "node stopped");
}

Node::udp::endpoint Node::local_endpoint() const {
  std::error_code ec;
  auto ep = socket_.local_endpoint(ec);
  return ec ? udp::endpoint() : ep;
}

void Node::arm(asio::steady_timer &t, std::chrono::milliseconds period,
               void (Node::*fn)()) {
  t.expires_after(period);
  std::weak_ptr<bool> alive = alive_;
  t.async_wait([this, alive, &t, period, fn](std::error_code ec) {
    if (alive.expired() || ec || !running_)
      return;
    (this->*fn)();
    arm(t, period, fn);
  });
}

void Node::do_receive() {
  std::weak_ptr<bool> alive = alive_;
  socket_.async_receive_from(
      asio::buffer(recv_buf_), recv_from_,
      [this, alive](std::error_code ec, std::size_t n) {
        if (alive.expired() || ec == asio::error::operation_aborted ||
            !running_)
          return;
        if (ec)
          Logger::instance().log(LogLevel::DEBUG, "receive error: %s",
                                 ec.message().c_str());
        else
          handle_datagram(recv_from_, recv_buf_.data(), n);
        do_receive();
      });
}

void Node::do_send() {
  if (sending_ || send_q_.empty() || !running_)
    return;
  sending_ = true;
  auto to = send_q_.front().first;
  auto buf = std::make_shared<std::vector<uint8_t>>(
      std::move(send_q_.front().second));
  send_q_.pop_front();
  std::weak_ptr<bool> alive = alive_;
  socket_.async_send_to(
      asio::buffer(*buf), to,
      [this, alive, buf, to](std::error_code ec, std::size_t n) {
        if (alive.expired() || ec == asio::error::operation_aborted)
          return;
        sending_ = false;
        if (!running_)
          return;
        if (ec)
          Logger::instance().log(LogLevel::WARN, "send to %s failed: %s",
                                 endpoint_str(to).c_str(), ec.message().c_str());
        else
          stats_.on_sent(n);
        do_send();
      });
}

void Node::send_packet(const udp::endpoint &to, MsgType type,
                       std::vector<uint8_t> payload) {
  if (!running_)
    return;
  Packet p;
  p.type = type;
  p.sequence = next_seq_++;
  p.timestamp = wall_seconds();
  p.payload = std::move(payload);
  std::vector<uint8_t> buf;
  if (!encode_packet(p, buf)) {
    Logger::instance().log(LogLevel::ERROR, "%s payload of %zu bytes too large",
                           msg_type_str(type), p.payload.size());
    return;
  }
  send_q_.emplace_back(to, std::move(buf));
  do_send();
}

void Node::handle_datagram(const udp::endpoint &from, const uint8_t *data,
                           size_t n) {
  stats_.on_received(n);
  Packet pkt;
  DecodeStatus st = decode_packet(data, n, pkt);
  if (st != DecodeStatus::Ok) {
    malformed(from, decode_status_str(st));
    return;
  }
  switch (pkt.type) {
  case MsgType::HANDSHAKE:
    handle_handshake(from, pkt);
    break;
  case MsgType::HEARTBEAT:
    if (peers_.on_heartbeat(from, Clock::now()))
      on_peer_admitted(from, NodeRole::Viewer);
    break;
  case MsgType::BITMAP:
    handle_bitmap(from, pkt);
    break;
  case MsgType::REQUEST:
    handle_request(from, pkt);
    break;
  case MsgType::DATA:
    handle_data(from, pkt);
    break;
  case MsgType::PEER_LIST:
    handle_peer_list(from, pkt);
    break;
  case MsgType::PING:
  case MsgType::PONG:
    handle_ping(from, pkt);
    break;
  case MsgType::STATS_REPORT:
    handle_stats_report(from, pkt);
    break;
  default:
    if (peers_.touch(from, Clock::now()))
      on_peer_admitted(from, NodeRole::Viewer);
    Logger::instance().log(LogLevel::DEBUG, "ignoring message type %u from %s",
                           (unsigned)pkt.type, endpoint_str(from).c_str());
    break;
  }
}

void Node::malformed(const udp::endpoint &from, const char *what) {
  stats_.on_malformed();
  Logger::instance().log(LogLevel::WARN, "dropping malformed datagram from %s: %s",
                         endpoint_str(from).c_str(), what);
}

void Node::handle_handshake(const udp::endpoint &from, const Packet &pkt) {
  NodeRole role;
  uint8_t flags;
  if (!decode_handshake(pkt.payload, role, flags)) {
    malformed(from, "bad handshake payload");
    return;
  }
  bool created = peers_.on_handshake(from, role, Clock::now());
  Logger::instance().log(LogLevel::INFO, "HANDSHAKE from %s (%s)",
                         endpoint_str(from).c_str(), role_str(role));
  if (flags & HF_REPLY_REQUESTED)
    send_handshake(from, false);
  send_bitmap(from);
  if (cfg_.role == NodeRole::Origin && role == NodeRole::Viewer) {
    auto neighbors = distributor_.admit(from);
    send_peer_list(from, neighbors);
  }
  if (created)
    stats_.set_peers(peers_.size(), peers_.remote_union_size());
}

// Any traffic from an unknown address counts as a handshake.
void Node::on_peer_admitted(const udp::endpoint &peer, NodeRole peer_role) {
  stats_.set_peers(peers_.size(), peers_.remote_union_size());
  if (cfg_.role == NodeRole::Origin && peer_role == NodeRole::Viewer &&
      !distributor_.contains(peer)) {
    auto neighbors = distributor_.admit(peer);
    send_peer_list(peer, neighbors);
  }
  send_bitmap(peer);
}

void Node::handle_bitmap(const udp::endpoint &from, const Packet &pkt) {
  Bitmap bm;
  if (!decode_bitmap(pkt.payload, bm)) {
    malformed(from, "bad bitmap payload");
    return;
  }
  scheduler_.on_bitmap(from, bm);
  if (peers_.on_bitmap(from, std::move(bm), Clock::now()))
    on_peer_admitted(from, NodeRole::Viewer);
}

void Node::handle_request(const udp::endpoint &from, const Packet &pkt) {
  ChunkId id;
  if (!decode_request(pkt.payload, id)) {
    malformed(from, "bad request payload");
    return;
  }
  if (peers_.touch(from, Clock::now()))
    on_peer_admitted(from, NodeRole::Viewer);
  if (!scheduler_.on_request(from, id, store_)) {
    Logger::instance().log(LogLevel::DEBUG, "%s requested chunk %llu, not held",
                           endpoint_str(from).c_str(), (unsigned long long)id);
    return;
  }
  flush_peer(from, 0);
}

void Node::handle_data(const udp::endpoint &from, const Packet &pkt) {
  Chunk c;
  if (!chunk_from_payload(pkt.payload, c)) {
    malformed(from, "bad chunk header");
    return;
  }
  if (peers_.touch(from, Clock::now()))
    on_peer_admitted(from, NodeRole::Viewer);

  ChunkId id = c.id();
  if (cfg_.role == NodeRole::Viewer && reassembler_.is_stale(c.hdr.frame_id)) {
    stats_.on_stale_fragment();
    Logger::instance().log(LogLevel::DEBUG, "stale chunk %llu (frame %u) from %s",
                           (unsigned long long)id, c.hdr.frame_id,
                           endpoint_str(from).c_str());
    return;
  }
  if (!store_.put(id, pkt.payload)) {
    stats_.on_duplicate_chunk();
    Logger::instance().log(LogLevel::DEBUG, "duplicate chunk %llu from %s",
                           (unsigned long long)id, endpoint_str(from).c_str());
    return;
  }
  stats_.on_chunk_downloaded(endpoint_str(from), pkt.payload.size());
  scheduler_.on_chunk_stored(id);
  scheduler_.on_chunk_received(id, from, peers_);

  if (cfg_.role != NodeRole::Viewer)
    return;
  auto frame = reassembler_.accept(c);
  stats_.set_buffered_frames(reassembler_.buffered_frames());
  if (!frame)
    return;
  stats_.on_frame_emitted(reassembler_.buffered_frames());
  if (on_frame_)
    on_frame_(*frame);
  evict_before_frame(frame->frame_id);
}

void Node::handle_peer_list(const udp::endpoint &from, const Packet &pkt) {
  std::vector<PeerEntry> entries;
  if (!decode_peer_list(pkt.payload, entries)) {
    malformed(from, "bad peer list");
    return;
  }
  if (peers_.touch(from, Clock::now()))
    on_peer_admitted(from, NodeRole::Viewer);
  size_t fresh = 0;
  for (auto &e : entries) {
    std::error_code ec;
    auto addr = asio::ip::make_address(e.host, ec);
    if (ec || addr.is_unspecified())
      continue;
    udp::endpoint ep(addr, e.port);
    if (ep == from)
      continue;
    if (peers_.contains(ep)) {
      peers_.set_role(ep, e.role);
      continue;
    }
    Logger::instance().log(LogLevel::INFO, "discovered %s (%s) via %s",
                           endpoint_str(ep).c_str(), role_str(e.role),
                           endpoint_str(from).c_str());
    send_handshake(ep, true);
    fresh++;
  }
  if (fresh)
    Logger::instance().log(LogLevel::DEBUG, "peer list from %s: %zu new",
                           endpoint_str(from).c_str(), fresh);
}

void Node::handle_ping(const udp::endpoint &from, const Packet &pkt) {
  uint64_t stamp;
  if (!decode_ping(pkt.payload, stamp)) {
    malformed(from, "bad ping payload");
    return;
  }
  auto now = Clock::now();
  if (pkt.type == MsgType::PING) {
    if (peers_.touch(from, now))
      on_peer_admitted(from, NodeRole::Viewer);
    send_packet(from, MsgType::PONG, pkt.payload);
    return;
  }
  // The stamp is our own clock reading echoed back.
  Clock::time_point sent{Clock::duration(stamp)};
  if (sent > now) {
    malformed(from, "pong from the future");
    return;
  }
  if (peers_.on_pong(from, now - sent, now))
    on_peer_admitted(from, NodeRole::Viewer);
  stats_.set_avg_rtt(peers_.average_rtt());
}

void Node::handle_stats_report(const udp::endpoint &from, const Packet &pkt) {
  StatsReport r;
  if (!decode_stats_report(pkt.payload, r)) {
    malformed(from, "bad stats report");
    return;
  }
  if (peers_.touch(from, Clock::now()))
    on_peer_admitted(from, r.role);
  if (cfg_.role != NodeRole::Origin)
    return;
  stats_.record_peer_report(endpoint_str(from), r);
  Logger::instance().log(LogLevel::DEBUG,
                         "report from %s: down %u B/s up %u B/s buffered %u",
                         endpoint_str(from).c_str(), r.download_rate,
                         r.upload_rate, (unsigned)r.buffered_frames);
}

void Node::connect_to(const udp::endpoint &ep) {
  Logger::instance().log(LogLevel::INFO, "connecting to %s",
                         endpoint_str(ep).c_str());
  send_handshake(ep, true);
}

void Node::send_handshake(const udp::endpoint &to, bool reply_requested) {
  send_packet(to, MsgType::HANDSHAKE,
              encode_handshake(cfg_.role,
                               reply_requested ? HF_REPLY_REQUESTED : 0));
}

void Node::send_bitmap(const udp::endpoint &to) {
  send_packet(to, MsgType::BITMAP,
              encode_bitmap(store_.bitmap(), cfg_.max_bitmap_ranges));
}

void Node::send_peer_list(const udp::endpoint &to,
                          const std::vector<udp::endpoint> &list) {
  std::vector<PeerEntry> entries;
  for (auto &ep : list) {
    if (ep == to)
      continue;
    PeerEntry e;
    e.host = ep.address().to_string();
    e.port = ep.port();
    auto info = peers_.find(ep);
    e.role = info ? info->role : NodeRole::Viewer;
    entries.push_back(std::move(e));
  }
  send_packet(to, MsgType::PEER_LIST, encode_peer_list(entries));
}

void Node::send_chunk(const udp::endpoint &to, ChunkId id) {
  auto payload = store_.get(id);
  if (!payload) {
    Logger::instance().log(LogLevel::DEBUG, "chunk %llu evicted before send",
                           (unsigned long long)id);
    return;
  }
  send_packet(to, MsgType::DATA, *payload);
}

void Node::flush_peer(const udp::endpoint &peer, size_t push_budget) {
  for (auto &out : scheduler_.drain(peer, push_budget)) {
    send_chunk(out.peer, out.chunk);
    stats_.on_served(out.pull);
  }
}

bool Node::publish_frame(const std::vector<uint8_t> &frame) {
  if (cfg_.role != NodeRole::Origin) {
    Logger::instance().log(LogLevel::WARN, "only the origin publishes frames");
    return false;
  }
  uint32_t frame_id = next_frame_id_;
  std::vector<Chunk> chunks;
  if (!fragmenter_.split(frame, frame_id, chunks)) {
    Logger::instance().log(LogLevel::WARN,
                           "frame of %zu bytes exceeds %u fragments, dropped",
                           frame.size(), kFragmentsPerFrame);
    return false;
  }
  next_frame_id_++;
  for (auto &c : chunks) {
    ChunkId id = c.id();
    store_.put(id, chunk_to_payload(c));
    auto target = distributor_.next_target();
    if (target)
      send_chunk(*target, id);
  }
  stats_.on_frame_published();
  evict_before_frame(frame_id);
  return true;
}

bool Node::store_chunk(const Chunk &c) {
  return store_.put(c.id(), chunk_to_payload(c));
}

ChunkId Node::playback_cursor() const {
  auto last = reassembler_.last_emitted();
  if (last)
    return make_chunk_id(*last + 1, 0);
  // Not playing yet: join at the newest frame anyone holds.
  ChunkId newest = 0;
  bool any = false;
  if (auto h = store_.highest()) {
    newest = *h;
    any = true;
  }
  for (auto &kv : peers_.peers()) {
    if (kv.second.remote_bitmap.empty())
      continue;
    ChunkId top = *kv.second.remote_bitmap.rbegin();
    if (!any || top > newest)
      newest = top;
    any = true;
  }
  return any ? make_chunk_id(frame_of(newest), 0) : 0;
}

void Node::evict_before_frame(uint32_t newest_frame) {
  if (cfg_.horizon_frames == 0 || newest_frame < cfg_.horizon_frames)
    return;
  uint32_t keep_from = newest_frame - cfg_.horizon_frames + 1;
  size_t n = store_.evict_below(make_chunk_id(keep_from, 0));
  if (n)
    Logger::instance().log(LogLevel::TRACE, "evicted %zu chunks below frame %u",
                           n, keep_from);
}

void Node::heartbeat_task() {
  stats_.set_peers(peers_.size(), peers_.remote_union_size());
  stats_.set_avg_rtt(peers_.average_rtt());
  auto stamp = (uint64_t)Clock::now().time_since_epoch().count();
  for (auto &ep : peers_.addresses()) {
    send_packet(ep, MsgType::HEARTBEAT, {});
    send_packet(ep, MsgType::PING, encode_ping(stamp));
  }
}

void Node::bitmap_task() {
  stats_.set_local_bitmap(store_.summary());
  for (auto &ep : peers_.addresses())
    send_bitmap(ep);
}

void Node::prune_task() {
  auto dead = peers_.prune_dead(Clock::now(), cfg_.dead_threshold);
  for (auto &ep : dead) {
    scheduler_.drop_peer(ep);
    distributor_.remove(ep);
    stats_.drop_peer_report(endpoint_str(ep));
    Logger::instance().log(LogLevel::INFO, "pruned silent peer %s",
                           endpoint_str(ep).c_str());
  }
  if (!dead.empty())
    stats_.set_peers(peers_.size(), peers_.remote_union_size());
}

void Node::schedule_task() {
  auto pulls =
      scheduler_.plan_pulls(store_, peers_, playback_cursor(), Clock::now());
  for (auto &d : pulls) {
    send_packet(d.peer, MsgType::REQUEST, encode_request(d.chunk));
    stats_.on_request_sent();
    Logger::instance().log(LogLevel::TRACE, "requested chunk %llu from %s",
                           (unsigned long long)d.chunk,
                           endpoint_str(d.peer).c_str());
  }
  for (auto &ep : scheduler_.peers_with_pending())
    flush_peer(ep, scheduler_.config().push_burst);
}

void Node::pex_task() {
  auto all = peers_.addresses();
  for (auto &ep : all)
    send_peer_list(ep, all);
}

void Node::stats_task() {
  stats_.update_rates(Clock::now());
  Logger::instance().log(LogLevel::INFO, "stats: %s",
                         stats_.report_line().c_str());
  if (cfg_.role != NodeRole::Viewer)
    return;
  const StatsSnapshot &s = stats_.snapshot();
  StatsReport r;
  r.role = cfg_.role;
  r.download_rate = (uint32_t)std::min(s.download_rate, 4294967295.0);
  r.upload_rate = (uint32_t)std::min(s.upload_rate, 4294967295.0);
  r.buffered_frames = (uint16_t)std::min(s.buffered_frames, (size_t)0xFFFF);
  r.peer_count = (uint16_t)std::min(peers_.size(), (size_t)0xFFFF);
  auto rtt_us =
      std::chrono::duration_cast<std::chrono::microseconds>(peers_.average_rtt());
  r.avg_rtt_us = (uint32_t)std::min<int64_t>(rtt_us.count(), 0xFFFFFFFFll);
  auto payload = encode_stats_report(r);
  for (auto &kv : peers_.peers())
    if (kv.second.role == NodeRole::Origin)
      send_packet(kv.first, MsgType::STATS_REPORT, payload);
}

} // namespace swarmcast
