#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace cmlink::util {

// Shared source of randomness for endpoint picks and handshake nonces.
// Seed it explicitly to get a reproducible sequence.
class Random {
public:
    Random();
    explicit Random(std::uint64_t seed);

    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    std::string bytes(std::size_t count);

    // Uniform index in [0, bound). bound must be non-zero.
    std::size_t index(std::size_t bound);

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

} // namespace cmlink::util
