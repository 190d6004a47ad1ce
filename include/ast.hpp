#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace roller {

// Целочисленное значение выражения
using Value = std::int64_t;

struct Expression;

// Узлы дерева неизменяемы после построения, поэтому поддеревья
// разделяются между выражением и результатами его вычислений
using ExpressionPtr = std::shared_ptr<const Expression>;

// Числовая константа (лист дерева)
struct Constant {
    Value value;
};

enum class DiceKind {
    Standard, // Грани от 1 до sides
    Fudge     // Кубик Fudge/FATE: -1, 0, +1
};

// Бросок count кубиков
struct DiceTerm {
    Value count;
    Value sides;
    DiceKind kind = DiceKind::Standard;

    // Минимальное и максимальное значение одного кубика
    Value lowest() const { return kind == DiceKind::Fudge ? -1 : 1; }
    Value highest() const { return kind == DiceKind::Fudge ? 1 : sides; }
};

enum class ModifierKind {
    KeepHighest, // kh
    KeepLowest,  // kl
    DropHighest, // dh
    DropLowest   // dl
};

// Отбор части кубиков из броска. child всегда указывает на DiceTerm.
struct Modifier {
    ModifierKind kind;
    Value amount;
    ExpressionPtr child;

    // Сколько кубиков остаётся после отбора
    Value keepCount() const;

    // true, если сохраняются наибольшие значения
    bool keepsHighest() const;
};

enum class BinaryOperator { Add, Sub, Mul, Div };

// Бинарная арифметическая операция
struct BinaryOp {
    BinaryOperator op;
    ExpressionPtr left;
    ExpressionPtr right;
};

// Повтор выражения count раз: "3 2d6" даёт список из трёх значений
struct ListExpansion {
    Value count;
    ExpressionPtr body;
};

// Выражения через запятую: "3d6, 2 d20"
struct Sequence {
    std::vector<ExpressionPtr> items;
};

// Закрытый набор вариантов. Новый вариант требует обработки в ast.cpp,
// transformer.cpp, evaluator.cpp и result.cpp: std::visit не соберётся,
// если какой-то из них пропущен.
using ExpressionNode = std::variant<Constant, DiceTerm, Modifier, BinaryOp, ListExpansion, Sequence>;

// Узел дерева вычисления
struct Expression {
    ExpressionNode node;

    // Каноническая запись выражения: "(2d20 kh1 + 8)"
    std::string text() const;

    // true для узлов, значение которых является списком
    bool isListValued() const;
};

char operatorSymbol(BinaryOperator op);
std::string modifierSuffix(ModifierKind kind);

// Фабрики узлов. Проверяют инварианты и выбрасывают SemanticError.
ExpressionPtr makeConstant(Value value);
ExpressionPtr makeDice(Value count, Value sides);
ExpressionPtr makeFudgeDice(Value count);
ExpressionPtr makeModifier(ModifierKind kind, Value amount, ExpressionPtr dice);
ExpressionPtr makeBinary(BinaryOperator op, ExpressionPtr left, ExpressionPtr right);
ExpressionPtr makeList(Value count, ExpressionPtr body);
ExpressionPtr makeSequence(std::vector<ExpressionPtr> items);

} // namespace roller
