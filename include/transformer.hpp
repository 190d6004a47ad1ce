#pragma once

#include <string>

#include "ast.hpp"
#include "parse_tree.hpp"

namespace roller {

// Преобразует дерево разбора в дерево вычисления.
// Все проверки значений выполняются здесь, до броска кубиков:
// при ошибке выбрасывается SemanticError.
class Transformer {
public:
    Transformer() = default;

    ExpressionPtr transform(const ParseNode& root) const;

private:
    ExpressionPtr transformSequence(const ParseNode& node) const;
    ExpressionPtr transformList(const ParseNode& node) const;
    ExpressionPtr transformBinary(const ParseNode& node) const;
    ExpressionPtr transformDiceRoll(const ParseNode& node) const;
    ExpressionPtr transformInteger(const ParseNode& node) const;

    // Переводит текст числа в Value с проверкой переполнения
    Value parseValue(const std::string& text) const;
};

} // namespace roller
