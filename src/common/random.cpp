
#include "random.hpp"
#include "logging.hpp"
#include <sodium.h>

namespace swarmcast {

bool random_init() {
  if (sodium_init() < 0) {
    Logger::instance().log(LogLevel::ERROR, "libsodium initialisation failed");
    return false;
  }
  return true;
}

uint32_t random_uniform(uint32_t upper) {
  if (upper < 2)
    return 0;
  return randombytes_uniform(upper);
}

uint32_t random_u32() { return randombytes_random(); }

} // namespace swarmcast
