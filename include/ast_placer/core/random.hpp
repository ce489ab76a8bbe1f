#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace ast_placer::core {

// Pseudorandom source handed to every sampling call.
// A fixed seed reproduces the same draws; no seed seeds from std::random_device.
class RandomSource {
public:
    RandomSource();
    explicit RandomSource(uint64_t seed);

    static RandomSource from_optional_seed(const std::optional<uint64_t>& seed);

    // U[0, 1)
    double uniform();

    // Uniform index in [0, n), n >= 1
    int index(int n);

    std::optional<uint64_t> seed() const { return seed_; }

private:
    std::mt19937_64 gen_;
    std::optional<uint64_t> seed_;
};

} // namespace ast_placer::core
