/**
 * @file random_source.cpp
 * @brief Mutex-guarded std::mt19937 behind the RandomSource interface.
 */
#include "strangler/routing/random_source.hpp"

namespace strangler::routing {

MtRandomSource::MtRandomSource()
    : engine_(std::random_device{}()) {}

MtRandomSource::MtRandomSource(std::uint64_t seed)
    : engine_(static_cast<std::mt19937::result_type>(seed)) {}

int MtRandomSource::roll(int upper) {
    if (upper <= 1) return 0;
    std::uniform_int_distribution<int> dist(0, upper - 1);
    std::lock_guard<std::mutex> lk(mu_);
    return dist(engine_);
}

} // namespace strangler::routing
