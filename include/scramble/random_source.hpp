#pragma once

#include <cstdint>
#include <random>

namespace scrambler {

/**
 * @brief Abstract random stream consumed by the RANDOM and INCREMENTAL methods
 *
 * One instance is one logical stream for a whole invocation. It is always
 * passed in explicitly so tests can substitute a scripted source.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform integer in [lo, hi] (inclusive)
    [[nodiscard]] virtual uint32_t uniform(uint32_t lo, uint32_t hi) = 0;
};

/**
 * @brief Mersenne Twister backed source
 *
 * Deterministic for an explicit seed. The default constructor draws its seed
 * from OpenSSL's CSPRNG.
 */
class MersenneRandomSource : public IRandomSource {
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(uint64_t seed);

    [[nodiscard]] uint32_t uniform(uint32_t lo, uint32_t hi) override;

    [[nodiscard]] uint64_t seed() const { return seed_; }

    /// 64-bit seed from RAND_bytes. Throws std::runtime_error if the CSPRNG fails.
    [[nodiscard]] static uint64_t secure_seed();

private:
    uint64_t seed_;
    std::mt19937_64 gen_;
};

} // namespace scrambler
