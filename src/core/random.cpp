#include "ast_placer/core/random.hpp"
#include "ast_placer/core/errors.hpp"

#include <string>

namespace ast_placer::core {

RandomSource::RandomSource() {
    std::random_device rd;
    gen_.seed((static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd()));
}

RandomSource::RandomSource(uint64_t seed) : gen_(seed), seed_(seed) {}

RandomSource RandomSource::from_optional_seed(const std::optional<uint64_t>& seed) {
    if (seed) {
        return RandomSource(*seed);
    }
    return RandomSource();
}

double RandomSource::uniform() {
    std::uniform_real_distribution<double> dis(0.0, 1.0);
    return dis(gen_);
}

int RandomSource::index(int n) {
    if (n < 1) {
        throw ValidationError("RandomSource::index needs n >= 1, got " + std::to_string(n));
    }
    std::uniform_int_distribution<int> dis(0, n - 1);
    return dis(gen_);
}

} // namespace ast_placer::core
