#include "scramble/random_source.hpp"

#include <openssl/rand.h>

#include <array>
#include <cstring>
#include <stdexcept>

namespace scrambler {

MersenneRandomSource::MersenneRandomSource()
    : MersenneRandomSource(secure_seed()) {}

MersenneRandomSource::MersenneRandomSource(uint64_t seed)
    : seed_(seed), gen_(seed) {}

uint32_t MersenneRandomSource::uniform(uint32_t lo, uint32_t hi) {
    std::uniform_int_distribution<uint32_t> dist(lo, hi);
    return dist(gen_);
}

uint64_t MersenneRandomSource::secure_seed() {
    std::array<unsigned char, sizeof(uint64_t)> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    uint64_t seed = 0;
    std::memcpy(&seed, bytes.data(), sizeof(seed));
    return seed;
}

} // namespace scrambler
