#include "random_source.hpp"

#include <stdexcept>

namespace roller {

MersenneRandomSource::MersenneRandomSource() : gen(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(std::uint64_t seed) : gen(seed) {}

Value MersenneRandomSource::next(Value lower, Value upper) {
    if (lower > upper) {
        throw std::invalid_argument("Пустой диапазон случайных чисел");
    }
    std::uniform_int_distribution<Value> dist(lower, upper);
    return dist(gen);
}

} // namespace roller
