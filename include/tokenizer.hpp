#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace roller {

// Класс лексического анализатора (лексера)
// Преобразует строку броска в последовательность токенов.
// Пробелы не порождают токенов, но запоминаются во флаге spaceBefore.
class Tokenizer {
public:
    // Конструктор принимает исходную строку броска
    explicit Tokenizer(std::string sourceText);

    // Основной метод запуска токенизации
    // Возвращает вектор токенов, заканчивающийся токеном End
    // Выбрасывает SyntaxError при обнаружении неизвестных символов
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    bool isAtEnd() const;
    char peek() const;
    char peekNext() const;
    char advance();

    // Пропускает пробелы; возвращает true, если что-то было пропущено
    bool skipWhitespace();

    // Проверяет, начинается ли с текущей позиции описание граней: d6, dF
    bool atDiceSides() const;

    // Считывает число или бросок с явным количеством (3d6)
    Token makeNumberOrDice();

    // Считывает бросок без количества (d20) или модификатор (kh1)
    Token makeWord();

    // Дочитывает "dN" или "dF" после количества кубиков
    void readDiceSides();
};

} // namespace roller
