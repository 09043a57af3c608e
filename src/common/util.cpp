
#include "util.hpp"
#include <stdexcept>

namespace swarmcast {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  host = s.substr(0, pos);
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  try {
    size_t used = 0;
    int p = std::stoi(s.substr(pos + 1), &used);
    if (used != s.size() - pos - 1 || p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::logic_error &) {
    return false;
  }
}

bool parse_role(const std::string &s, NodeRole &out) {
  if (s == "origin" || s == "broadcaster")
    out = NodeRole::Origin;
  else if (s == "viewer")
    out = NodeRole::Viewer;
  else
    return false;
  return true;
}

bool parse_millis(const std::string &s, long &out) {
  try {
    size_t used = 0;
    long v = std::stol(s, &used);
    if (used != s.size() || v <= 0)
      return false;
    out = v;
    return true;
  } catch (const std::logic_error &) {
    return false;
  }
}

} // namespace swarmcast
