/**
 * @file random_source.cpp
 * @brief Mutex-guarded mt19937_64 random source.
 */
#include "keypool/selection/random_source.hpp"

namespace keypool::selection {

namespace {
std::uint64_t device_seed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}
} // namespace

SharedRandomSource::SharedRandomSource() : engine_(device_seed()) {}

double SharedRandomSource::uniform(double upper) {
    std::uniform_real_distribution<double> dist(0.0, upper);
    std::lock_guard<std::mutex> lk(mu_);
    return dist(engine_);
}

} // namespace keypool::selection
