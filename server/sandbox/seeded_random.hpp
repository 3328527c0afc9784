#pragma once

#include <cstdint>

namespace server::sandbox {

// Mulberry32: 32-bit state, output in [0, 1). The sequence depends only on
// the seed, so a recorded seed replays a session exactly.
class SeededRandom {
public:
    explicit SeededRandom(std::uint32_t seed) : seed_(seed), state_(seed) {}

    double next();

    std::uint32_t seed() const { return seed_; }

private:
    std::uint32_t seed_;
    std::uint32_t state_;
};

// Fresh 32-bit seed from the OpenSSL CSPRNG. Throws std::runtime_error on failure.
std::uint32_t generate_seed();

} // namespace server::sandbox
