#include "logging.hpp"
#include "node.hpp"
#include "random.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <csignal>
#include <cstdio>
#include <functional>
#include <iostream>

using namespace swarmcast;

namespace {

// Stand-in capture adapter: frames of a fixed size with a rolling pattern.
std::vector<uint8_t> synthetic_frame(uint64_t n, size_t size) {
  std::vector<uint8_t> f(size);
  for (size_t i = 0; i < size; i++)
    f[i] = (uint8_t)((n * 31 + i) & 0xFF);
  return f;
}

void usage() {
  std::cerr << "usage: swarmcast_node --role origin|viewer --listen host:port\n"
               "       [--connect host:port] [--policy push|rarest|edf]\n"
               "       [--fps N] [--frame-size BYTES] [--log-level LEVEL]\n"
               "       [--log-file PATH]\n"
               "       [--tick-ms N] [--bitmap-ms N] [--heartbeat-ms N]\n"
               "       [--prune-ms N] [--dead-ms N] [--window N]\n";
}

} // namespace

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:47000";
  std::string role = "viewer";
  std::string connect;
  std::string policy = "rarest";
  std::string log_level = "info";
  std::string log_file;
  int fps = 20;
  size_t frame_size = 30000;
  long tick_ms = 100, bitmap_ms = 1000, heartbeat_ms = 2000, prune_ms = 5000,
       dead_ms = 5000;
  size_t window = 16;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto millis = [&](int &i, long &out) {
      std::string v = next(i);
      if (!parse_millis(v, out)) {
        std::cerr << "bad value for " << a << ": " << v << "\n";
        std::exit(1);
      }
    };
    if (a == "--listen")
      listen = next(i);
    else if (a == "--role")
      role = next(i);
    else if (a == "--connect")
      connect = next(i);
    else if (a == "--policy")
      policy = next(i);
    else if (a == "--log-level")
      log_level = next(i);
    else if (a == "--log-file")
      log_file = next(i);
    else if (a == "--fps")
      fps = std::stoi(next(i));
    else if (a == "--frame-size")
      frame_size = (size_t)std::stoul(next(i));
    else if (a == "--window")
      window = (size_t)std::stoul(next(i));
    else if (a == "--tick-ms")
      millis(i, tick_ms);
    else if (a == "--bitmap-ms")
      millis(i, bitmap_ms);
    else if (a == "--heartbeat-ms")
      millis(i, heartbeat_ms);
    else if (a == "--prune-ms")
      millis(i, prune_ms);
    else if (a == "--dead-ms")
      millis(i, dead_ms);
    else if (a == "--help" || a == "-h") {
      usage();
      return 0;
    } else {
      std::cerr << "unknown option " << a << "\n";
      usage();
      return 1;
    }
  }

  NodeConfig cfg;
  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);
  std::FILE *log_out = nullptr;
  if (!log_file.empty()) {
    log_out = std::fopen(log_file.c_str(), "a");
    if (!log_out) {
      std::cerr << "cannot open log file " << log_file << std::endl;
      return 1;
    }
    std::setvbuf(log_out, nullptr, _IOLBF, 0);
    Logger::instance().set_output(log_out);
  }
  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  if (!parse_role(role, cfg.role)) {
    std::cerr << "bad role" << std::endl;
    return 1;
  }
  if (!parse_policy(policy, cfg.policy)) {
    std::cerr << "bad policy" << std::endl;
    return 1;
  }
  if (fps <= 0) {
    std::cerr << "bad fps" << std::endl;
    return 1;
  }
  cfg.tick_period = std::chrono::milliseconds(tick_ms);
  cfg.bitmap_period = std::chrono::milliseconds(bitmap_ms);
  cfg.heartbeat_period = std::chrono::milliseconds(heartbeat_ms);
  cfg.prune_period = std::chrono::milliseconds(prune_ms);
  cfg.dead_threshold = std::chrono::milliseconds(dead_ms);
  cfg.window = window;
  if (cfg.tick_period > cfg.bitmap_period)
    Logger::instance().log(LogLevel::WARN,
                           "scheduler tick slower than bitmap advertisement");

  if (!random_init())
    return 1;

  asio::io_context io;
  Node node(io, cfg);
  if (!node.start())
    return 1;

  if (!connect.empty()) {
    std::string host;
    uint16_t port;
    std::error_code ec;
    if (!parse_host_port(connect, host, port)) {
      std::cerr << "bad connect" << std::endl;
      return 1;
    }
    asio::ip::udp::resolver res(io);
    auto results = res.resolve(asio::ip::udp::v4(), host, std::to_string(port), ec);
    if (ec || results.empty()) {
      std::cerr << "cannot resolve " << connect << ": " << ec.message() << std::endl;
      return 1;
    }
    node.connect_to(results.begin()->endpoint());
  }

  uint64_t frames_seen = 0;
  node.set_frame_handler([&frames_seen](const CompletedFrame &f) {
    if (++frames_seen % 100 == 0)
      Logger::instance().log(LogLevel::INFO, "rendered %llu frames (last %u, %zu bytes)",
                             (unsigned long long)frames_seen, f.frame_id,
                             f.bytes.size());
  });

  asio::steady_timer capture(io);
  uint64_t produced = 0;
  std::function<void()> capture_loop = [&]() {
    capture.expires_after(std::chrono::milliseconds(1000 / fps));
    capture.async_wait([&](std::error_code ec) {
      if (ec)
        return;
      node.publish_frame(synthetic_frame(produced++, frame_size));
      capture_loop();
    });
  };
  if (cfg.role == NodeRole::Origin)
    capture_loop();

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code, int) {
    capture.cancel();
    node.stop();
  });

  io.run();
  if (log_out) {
    Logger::instance().set_output(nullptr);
    std::fclose(log_out);
  }
  return 0;
}
