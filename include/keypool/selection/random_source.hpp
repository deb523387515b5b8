#pragma once
/**
 * @file random_source.hpp
 * @brief Injectable uniform random source for the weighted selector.
 * @details Implementations must be safe to call from many threads at once.
 */

#include <cstdint>
#include <mutex>
#include <random>

namespace keypool::selection {

/**
 * @class RandomSource
 * @brief Thread-safe source of uniform reals.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Draw uniformly from [0, upper). @p upper > 0.
    virtual double uniform(double upper) = 0;
};

/**
 * @class SharedRandomSource
 * @brief Mutex-guarded mt19937_64 shared by all callers.
 *
 * The critical section is a single engine step, so contention only matters
 * at very high request rates; inject a per-thread source in that case.
 */
class SharedRandomSource final : public RandomSource {
public:
    /// Seeded from std::random_device.
    SharedRandomSource();
    /// Fixed seed (tests, reproducible runs).
    explicit SharedRandomSource(std::uint64_t seed) noexcept : engine_(seed) {}

    double uniform(double upper) override;

private:
    std::mutex mu_;
    std::mt19937_64 engine_;
};

} // namespace keypool::selection
