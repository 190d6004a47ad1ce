#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace roller {

// Продукции грамматики, которые попадают в дерево разбора
enum class ParseRule {
    Sequence,       // list_expression ("," list_expression)*
    ListExpression, // expression | COUNT list_expression
    BinaryOp,       // expression ("+" | "-" | "*" | "/") expression
    Parens,         // "(" expression ")"
    DiceRoll,       // DICE directive*
    Directive,      // kh1, kl1, dh1, dl1
    Integer         // -?[0-9]+
};

// Узел конкретного дерева разбора.
// text хранит исходный текст токена: число, бросок, знак операции.
// Для ListExpression с повтором text хранит количество повторов.
struct ParseNode {
    ParseRule rule;
    std::string text;
    std::size_t position = 0;
    std::vector<ParseNode> children;
};

} // namespace roller
