#pragma once

#include <string>

#include "ast.hpp"
#include "random_source.hpp"
#include "result.hpp"

namespace roller {

// Класс-фасад для бросков по строке.
// Объединяет этапы токенизации, парсинга, преобразования и вычисления.
class DiceRoller {
public:
    explicit DiceRoller(RandomSource& random);

    // Разбирает строку в дерево вычисления без бросков.
    // Выбрасывает SyntaxError или SemanticError.
    ExpressionPtr compile(const std::string& rollString) const;

    // Полный цикл: разбор и один бросок.
    // Пример: "2 2d20 kh1 + 8" -> список из двух результатов
    ResultNode roll(const std::string& rollString) const;

    // Бросок уже разобранного выражения
    ResultNode roll(const ExpressionPtr& expression) const;

private:
    RandomSource& random;
};

} // namespace roller
