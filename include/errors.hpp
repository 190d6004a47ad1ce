#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace roller {

// Некорректный текст выражения (ошибка лексера или парсера).
// Хранит позицию в исходной строке, где разбор остановился.
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message, std::size_t position)
        : std::runtime_error(message + " (позиция " + std::to_string(position) + ")"),
          position(position) {}

    std::size_t where() const { return position; }

private:
    std::size_t position;
};

// Синтаксически верное выражение с недопустимыми значениями
// (ноль кубиков, ноль граней, модификатор больше числа кубиков)
class SemanticError : public std::runtime_error {
public:
    explicit SemanticError(const std::string& message) : std::runtime_error(message) {}
};

// Ошибка во время вычисления (например, деление на ноль)
class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace roller
