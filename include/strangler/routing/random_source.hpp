#pragma once
/**
 * @file random_source.hpp
 * @brief Injectable source of migration rolls.
 * @details The router never touches a global generator. Production wires a
 *          seeded MtRandomSource; tests wire a fixed sequence.
 */

#include <cstdint>
#include <mutex>
#include <random>

namespace strangler::routing {

/** @class RandomSource
 *  @brief Uniform integer draws in [0, upper).
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Draw one value.
     * @param upper Exclusive upper bound, must be > 0.
     * @return Value in [0, upper).
     * @note Called concurrently from request handlers; implementations synchronize.
     */
    virtual int roll(int upper) = 0;
};

/** @class MtRandomSource
 *  @brief Mersenne Twister seeded once at construction, guarded by a mutex.
 */
class MtRandomSource final : public RandomSource {
public:
    /// Seed from std::random_device.
    MtRandomSource();
    /// Seed explicitly (reproducible runs).
    explicit MtRandomSource(std::uint64_t seed);

    int roll(int upper) override;

private:
    std::mutex   mu_;
    std::mt19937 engine_;
};

} // namespace strangler::routing
