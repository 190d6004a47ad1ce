#include "ast.hpp"

#include "errors.hpp"

namespace roller {

namespace {
// Ограничения, при которых вычисление остаётся быстрым
constexpr Value kMaxDiceCount = 10000;
constexpr Value kMaxListCount = 1000;
// Общий предел числа бросков и узлов результата на одно вычисление
constexpr Value kMaxRollWork = 100000;

// Построение канонической записи выражения
struct TextVisitor {
    std::string operator()(const Constant& constant) const {
        return std::to_string(constant.value);
    }

    std::string operator()(const DiceTerm& dice) const {
        std::string sides = dice.kind == DiceKind::Fudge ? "F" : std::to_string(dice.sides);
        return std::to_string(dice.count) + "d" + sides;
    }

    std::string operator()(const Modifier& modifier) const {
        return modifier.child->text() + " " + modifierSuffix(modifier.kind) +
               std::to_string(modifier.amount);
    }

    std::string operator()(const BinaryOp& binary) const {
        return "(" + binary.left->text() + " " + operatorSymbol(binary.op) + " " +
               binary.right->text() + ")";
    }

    std::string operator()(const ListExpansion& list) const {
        return std::to_string(list.count) + " " + list.body->text();
    }

    std::string operator()(const Sequence& sequence) const {
        std::string result;
        for (std::size_t i = 0; i < sequence.items.size(); ++i) {
            if (i > 0) {
                result += ", ";
            }
            result += sequence.items[i]->text();
        }
        return result;
    }
};

// Оценка объёма работы: число бросаемых кубиков и листьев результата.
// Поддеревья списков уже проверены на kMaxRollWork, поэтому сумма не переполняется.
struct WorkVisitor {
    Value operator()(const Constant&) const { return 1; }

    Value operator()(const DiceTerm& dice) const { return dice.count; }

    Value operator()(const Modifier& modifier) const {
        return std::visit(*this, modifier.child->node);
    }

    Value operator()(const BinaryOp& binary) const {
        return std::visit(*this, binary.left->node) + std::visit(*this, binary.right->node);
    }

    Value operator()(const ListExpansion& list) const {
        return list.count * std::visit(*this, list.body->node);
    }

    Value operator()(const Sequence& sequence) const {
        Value total = 0;
        for (const auto& item : sequence.items) {
            total += std::visit(*this, item->node);
        }
        return total;
    }
};

void checkWork(Value repetitions, const Expression& body, const std::string& text) {
    Value work = std::visit(WorkVisitor{}, body.node);
    if (work > kMaxRollWork / repetitions) {
        throw SemanticError("Слишком большой объём бросков в " + text + " (не больше " +
                            std::to_string(kMaxRollWork) + " кубиков и значений)");
    }
}

ExpressionPtr makeNode(ExpressionNode node) {
    return std::make_shared<const Expression>(Expression{std::move(node)});
}

void checkDiceCount(Value count) {
    if (count <= 0) {
        throw SemanticError("Количество кубиков должно быть положительным, получено " +
                            std::to_string(count));
    }
    if (count > kMaxDiceCount) {
        throw SemanticError("Слишком много кубиков: " + std::to_string(count) +
                            " (не больше " + std::to_string(kMaxDiceCount) + ")");
    }
}
}

Value Modifier::keepCount() const {
    const auto& dice = std::get<DiceTerm>(child->node);
    switch (kind) {
    case ModifierKind::KeepHighest:
    case ModifierKind::KeepLowest:
        return amount;
    case ModifierKind::DropHighest:
    case ModifierKind::DropLowest:
        return dice.count - amount;
    }
    return amount;
}

bool Modifier::keepsHighest() const {
    // Отбросить наименьшие — то же самое, что оставить наибольшие
    return kind == ModifierKind::KeepHighest || kind == ModifierKind::DropLowest;
}

std::string Expression::text() const {
    return std::visit(TextVisitor{}, node);
}

bool Expression::isListValued() const {
    return std::holds_alternative<ListExpansion>(node) || std::holds_alternative<Sequence>(node);
}

char operatorSymbol(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Add:
        return '+';
    case BinaryOperator::Sub:
        return '-';
    case BinaryOperator::Mul:
        return '*';
    case BinaryOperator::Div:
        return '/';
    }
    return '?';
}

std::string modifierSuffix(ModifierKind kind) {
    switch (kind) {
    case ModifierKind::KeepHighest:
        return "kh";
    case ModifierKind::KeepLowest:
        return "kl";
    case ModifierKind::DropHighest:
        return "dh";
    case ModifierKind::DropLowest:
        return "dl";
    }
    return "?";
}

ExpressionPtr makeConstant(Value value) {
    return makeNode(Constant{value});
}

ExpressionPtr makeDice(Value count, Value sides) {
    checkDiceCount(count);
    if (sides <= 0) {
        throw SemanticError("Количество граней должно быть положительным, получено " +
                            std::to_string(sides));
    }
    return makeNode(DiceTerm{count, sides, DiceKind::Standard});
}

ExpressionPtr makeFudgeDice(Value count) {
    checkDiceCount(count);
    return makeNode(DiceTerm{count, 3, DiceKind::Fudge});
}

ExpressionPtr makeModifier(ModifierKind kind, Value amount, ExpressionPtr dice) {
    if (!dice || !std::holds_alternative<DiceTerm>(dice->node)) {
        throw SemanticError("Модификатор применим только к броску кубиков");
    }
    const auto& term = std::get<DiceTerm>(dice->node);
    if (amount <= 0) {
        throw SemanticError("Модификатор " + modifierSuffix(kind) +
                            " требует положительного количества кубиков");
    }
    if (amount > term.count) {
        throw SemanticError("Модификатор " + modifierSuffix(kind) + std::to_string(amount) +
                            " превышает число кубиков в броске " + dice->text());
    }
    return makeNode(Modifier{kind, amount, std::move(dice)});
}

ExpressionPtr makeBinary(BinaryOperator op, ExpressionPtr left, ExpressionPtr right) {
    if (!left || !right) {
        throw SemanticError("У бинарной операции должны быть оба операнда");
    }
    if (left->isListValued() || right->isListValued()) {
        throw SemanticError("Список нельзя использовать в арифметике: " +
                            (left->isListValued() ? left->text() : right->text()));
    }
    return makeNode(BinaryOp{op, std::move(left), std::move(right)});
}

ExpressionPtr makeList(Value count, ExpressionPtr body) {
    if (count <= 0) {
        throw SemanticError("Количество повторов должно быть положительным, получено " +
                            std::to_string(count));
    }
    if (count > kMaxListCount) {
        throw SemanticError("Слишком много повторов: " + std::to_string(count));
    }
    if (!body || std::holds_alternative<Sequence>(body->node)) {
        throw SemanticError("Повторять можно только выражение или список");
    }
    checkWork(count, *body, std::to_string(count) + " " + body->text());
    return makeNode(ListExpansion{count, std::move(body)});
}

ExpressionPtr makeSequence(std::vector<ExpressionPtr> items) {
    if (items.size() < 2) {
        throw SemanticError("Последовательность должна содержать хотя бы два выражения");
    }
    for (const auto& item : items) {
        if (!item || std::holds_alternative<Sequence>(item->node)) {
            throw SemanticError("Последовательности не могут быть вложенными");
        }
    }
    auto sequence = makeNode(Sequence{std::move(items)});
    checkWork(1, *sequence, sequence->text());
    return sequence;
}

} // namespace roller
