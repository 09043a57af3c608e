
#pragma once
#include <string>
#include <cstdint>
#include "protocol.hpp"

namespace swarmcast {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
bool parse_role(const std::string& s, NodeRole& out);
// Plain integer milliseconds, e.g. "250".
bool parse_millis(const std::string& s, long& out);

} // namespace swarmcast
