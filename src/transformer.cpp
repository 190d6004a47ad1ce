#include "transformer.hpp"

#include "errors.hpp"

#include <cctype>
#include <stdexcept>

namespace roller {

namespace {
ModifierKind parseModifierKind(const std::string& prefix) {
    if (prefix == "kh") {
        return ModifierKind::KeepHighest;
    }
    if (prefix == "kl") {
        return ModifierKind::KeepLowest;
    }
    if (prefix == "dh") {
        return ModifierKind::DropHighest;
    }
    if (prefix == "dl") {
        return ModifierKind::DropLowest;
    }
    throw SemanticError("Неизвестный модификатор '" + prefix + "'");
}

BinaryOperator parseOperator(const std::string& symbol) {
    if (symbol == "+") {
        return BinaryOperator::Add;
    }
    if (symbol == "-") {
        return BinaryOperator::Sub;
    }
    if (symbol == "*") {
        return BinaryOperator::Mul;
    }
    if (symbol == "/") {
        return BinaryOperator::Div;
    }
    throw SemanticError("Неизвестная бинарная операция '" + symbol + "'");
}

std::string toLower(std::string text) {
    for (char& ch : text) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return text;
}

void expectChildren(const ParseNode& node, std::size_t count) {
    if (node.children.size() != count) {
        throw SemanticError("Некорректное дерево разбора возле позиции " +
                            std::to_string(node.position));
    }
}
}

ExpressionPtr Transformer::transform(const ParseNode& root) const {
    switch (root.rule) {
    case ParseRule::Sequence:
        return transformSequence(root);
    case ParseRule::ListExpression:
        return transformList(root);
    case ParseRule::BinaryOp:
        return transformBinary(root);
    case ParseRule::Parens:
        // Скобки только группируют, в дереве вычисления их нет
        expectChildren(root, 1);
        return transform(root.children.front());
    case ParseRule::DiceRoll:
        return transformDiceRoll(root);
    case ParseRule::Integer:
        return transformInteger(root);
    case ParseRule::Directive:
        throw SemanticError("Модификатор '" + root.text + "' без броска кубиков");
    }
    throw SemanticError("Неизвестное правило грамматики");
}

// Одиночное выражение не оборачивается в Sequence
ExpressionPtr Transformer::transformSequence(const ParseNode& node) const {
    if (node.children.empty()) {
        throw SemanticError("Пустая последовательность выражений");
    }
    if (node.children.size() == 1) {
        return transform(node.children.front());
    }

    std::vector<ExpressionPtr> items;
    items.reserve(node.children.size());
    for (const auto& child : node.children) {
        items.push_back(transform(child));
    }
    return makeSequence(std::move(items));
}

// [выражение] либо [количество, тело]
ExpressionPtr Transformer::transformList(const ParseNode& node) const {
    if (node.children.size() == 1) {
        return transform(node.children.front());
    }
    expectChildren(node, 2);

    const auto& countNode = node.children[0];
    if (countNode.rule != ParseRule::Integer) {
        throw SemanticError("Количество повторов должно быть целым числом");
    }
    Value count = parseValue(countNode.text);
    return makeList(count, transform(node.children[1]));
}

ExpressionPtr Transformer::transformBinary(const ParseNode& node) const {
    expectChildren(node, 2);
    auto left = transform(node.children[0]);
    auto right = transform(node.children[1]);
    return makeBinary(parseOperator(node.text), std::move(left), std::move(right));
}

// Разбор броска вида [N]d(S|F) и необязательного модификатора
ExpressionPtr Transformer::transformDiceRoll(const ParseNode& node) const {
    std::string text = toLower(node.text);
    std::size_t separator = text.find('d');
    if (separator == std::string::npos || separator + 1 >= text.size()) {
        throw SemanticError("Некорректная запись броска '" + node.text + "'");
    }

    std::string countText = text.substr(0, separator);
    std::string sidesText = text.substr(separator + 1);
    Value count = countText.empty() ? 1 : parseValue(countText);

    ExpressionPtr dice = sidesText == "f" ? makeFudgeDice(count)
                                          : makeDice(count, parseValue(sidesText));

    if (node.children.empty()) {
        return dice;
    }
    if (node.children.size() > 1) {
        throw SemanticError("К броску " + dice->text() + " можно применить только один модификатор");
    }

    const auto& directive = node.children.front();
    std::string directiveText = toLower(directive.text);
    if (directive.rule != ParseRule::Directive || directiveText.size() < 3) {
        throw SemanticError("Некорректный модификатор '" + directive.text + "'");
    }
    ModifierKind kind = parseModifierKind(directiveText.substr(0, 2));
    Value amount = parseValue(directiveText.substr(2));
    return makeModifier(kind, amount, std::move(dice));
}

ExpressionPtr Transformer::transformInteger(const ParseNode& node) const {
    return makeConstant(parseValue(node.text));
}

Value Transformer::parseValue(const std::string& text) const {
    try {
        std::size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw SemanticError("Некорректное число '" + text + "'");
        }
        return static_cast<Value>(value);
    } catch (const std::out_of_range&) {
        throw SemanticError("Слишком большое число '" + text + "'");
    } catch (const std::invalid_argument&) {
        throw SemanticError("Некорректное число '" + text + "'");
    }
}

} // namespace roller
