#pragma once

#include <cstdint>
#include <random>

#include "ast.hpp"

namespace roller {

// Источник случайных чисел для бросков.
// Передаётся в вычислитель явно, чтобы в тестах подставлять заранее
// заданную последовательность значений.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Равномерно распределённое целое в отрезке [lower, upper]
    virtual Value next(Value lower, Value upper) = 0;
};

// Источник на основе вихря Мерсенна
class MersenneRandomSource final : public RandomSource {
public:
    // Зерно берётся из std::random_device
    MersenneRandomSource();

    // Фиксированное зерно: одинаковые броски при каждом запуске
    explicit MersenneRandomSource(std::uint64_t seed);

    Value next(Value lower, Value upper) override;

private:
    std::mt19937_64 gen;
};

} // namespace roller
