
#pragma once
#include <cstdint>

namespace swarmcast {

// libsodium-backed randomness. random_init() must succeed before the
// other calls; it is safe to call more than once.
bool random_init();
// Uniform in [0, upper); returns 0 when upper is 0.
uint32_t random_uniform(uint32_t upper);
uint32_t random_u32();

} // namespace swarmcast
