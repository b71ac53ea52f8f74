#include "cmlink/util/Random.hpp"

#include <stdexcept>

namespace cmlink::util {

Random::Random()
    : engine_(std::random_device{}()) {}

Random::Random(std::uint64_t seed)
    : engine_(seed) {}

std::string Random::bytes(std::size_t count) {
    std::uniform_int_distribution<int> dist(0, 255);
    std::string output;
    output.reserve(count);
    std::scoped_lock lock(mutex_);
    for (std::size_t i = 0; i < count; ++i) {
        output.push_back(static_cast<char>(dist(engine_)));
    }
    return output;
}

std::size_t Random::index(std::size_t bound) {
    if (bound == 0) {
        throw std::invalid_argument("Random::index requires a non-empty range");
    }
    std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
    std::scoped_lock lock(mutex_);
    return dist(engine_);
}

} // namespace cmlink::util
