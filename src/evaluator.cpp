#include "evaluator.hpp"

#include "errors.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <string>

namespace roller {

namespace {
constexpr Value kMinValue = std::numeric_limits<Value>::min();
constexpr Value kMaxValue = std::numeric_limits<Value>::max();

// Арифметика с проверкой выхода за пределы Value
Value checkedAdd(Value left, Value right) {
    if ((right > 0 && left > kMaxValue - right) || (right < 0 && left < kMinValue - right)) {
        throw EvaluationError("Переполнение при сложении " + std::to_string(left) + " + " +
                              std::to_string(right));
    }
    return left + right;
}

Value checkedSubtract(Value left, Value right) {
    if ((right < 0 && left > kMaxValue + right) || (right > 0 && left < kMinValue + right)) {
        throw EvaluationError("Переполнение при вычитании " + std::to_string(left) + " - " +
                              std::to_string(right));
    }
    return left - right;
}

Value checkedMultiply(Value left, Value right) {
    bool overflow = false;
    if (left > 0) {
        overflow = right > 0 ? left > kMaxValue / right : right < kMinValue / left;
    } else if (left < 0) {
        overflow = right > 0 ? left < kMinValue / right : right < kMaxValue / left;
    }
    if (overflow) {
        throw EvaluationError("Переполнение при умножении " + std::to_string(left) + " * " +
                              std::to_string(right));
    }
    return left * right;
}

Value applyOperator(BinaryOperator op, Value left, Value right) {
    switch (op) {
    case BinaryOperator::Add:
        return checkedAdd(left, right);
    case BinaryOperator::Sub:
        return checkedSubtract(left, right);
    case BinaryOperator::Mul:
        return checkedMultiply(left, right);
    case BinaryOperator::Div:
        if (right == 0) {
            throw EvaluationError("Деление на ноль");
        }
        if (left == kMinValue && right == -1) {
            throw EvaluationError("Переполнение при делении");
        }
        // Целочисленное деление, дробная часть отбрасывается (к нулю)
        return left / right;
    }
    throw EvaluationError("Неизвестная бинарная операция");
}

// Значения списка результатов для поля value()
ResultValue collectValues(const std::vector<ResultNode>& results) {
    std::vector<ResultValue> values;
    values.reserve(results.size());
    for (const auto& result : results) {
        values.push_back(result.value());
    }
    return ResultValue::list(std::move(values));
}
}

Evaluator::Evaluator(RandomSource& random) : random(random) {}

ResultNode Evaluator::evaluate(const ExpressionPtr& expression) const {
    return std::visit([&](const auto& node) { return evaluateNode(expression, node); },
                      expression->node);
}

// Константа: значение без бросков и дочерних узлов
ResultNode Evaluator::evaluateNode(const ExpressionPtr& source, const Constant& constant) const {
    return ResultNode(source, ResultValue::scalar(constant.value));
}

// Бросок: count независимых значений в [lowest, highest], сумма — значение узла
ResultNode Evaluator::evaluateNode(const ExpressionPtr& source, const DiceTerm& dice) const {
    std::vector<Roll> rolls;
    rolls.reserve(static_cast<std::size_t>(dice.count));
    Value total = 0;
    for (Value i = 0; i < dice.count; ++i) {
        Value value = random.next(dice.lowest(), dice.highest());
        rolls.push_back({value, dice.sides});
        total = checkedAdd(total, value);
    }
    return ResultNode(source, ResultValue::scalar(total), std::move(rolls));
}

// Модификатор: бросает дочерний DiceTerm и суммирует только оставленные кубики.
// Исходный порядок бросков сохраняется для вывода.
ResultNode Evaluator::evaluateNode(const ExpressionPtr& source, const Modifier& modifier) const {
    ResultNode diceResult = evaluate(modifier.child);
    std::vector<Roll> rolls = diceResult.rolls();
    std::vector<bool> kept = selectKept(rolls, modifier.keepCount(), modifier.keepsHighest());

    Value total = 0;
    for (std::size_t i = 0; i < rolls.size(); ++i) {
        if (kept[i]) {
            total = checkedAdd(total, rolls[i].value);
        }
    }

    std::vector<ResultNode> children;
    children.push_back(std::move(diceResult));
    return ResultNode(source, ResultValue::scalar(total), std::move(rolls), std::move(kept),
                      std::move(children));
}

// Бинарная операция: сначала левый операнд, затем правый
ResultNode Evaluator::evaluateNode(const ExpressionPtr& source, const BinaryOp& binary) const {
    ResultNode left = evaluate(binary.left);
    ResultNode right = evaluate(binary.right);
    Value value = applyOperator(binary.op, left.value().asScalar(), right.value().asScalar());

    std::vector<ResultNode> children;
    children.push_back(std::move(left));
    children.push_back(std::move(right));
    return ResultNode(source, ResultValue::scalar(value), {}, {}, std::move(children));
}

// Повтор: тело вычисляется count раз, каждый раз с новыми бросками
ResultNode Evaluator::evaluateNode(const ExpressionPtr& source, const ListExpansion& list) const {
    std::vector<ResultNode> repetitions;
    repetitions.reserve(static_cast<std::size_t>(list.count));
    for (Value i = 0; i < list.count; ++i) {
        repetitions.push_back(evaluate(list.body));
    }
    ResultValue values = collectValues(repetitions);
    return ResultNode(source, std::move(values), {}, {}, std::move(repetitions));
}

// Последовательность: элементы вычисляются слева направо
ResultNode Evaluator::evaluateNode(const ExpressionPtr& source, const Sequence& sequence) const {
    std::vector<ResultNode> items;
    items.reserve(sequence.items.size());
    for (const auto& item : sequence.items) {
        items.push_back(evaluate(item));
    }
    ResultValue values = collectValues(items);
    return ResultNode(source, std::move(values), {}, {}, std::move(items));
}

std::vector<bool> selectKept(const std::vector<Roll>& rolls, Value keepCount, bool highest) {
    std::vector<std::size_t> order(rolls.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    // Сортируется копия индексов, сами броски остаются в исходном порядке.
    // Из равных значений остаётся более ранний бросок, и для kh/kl, и для dh/dl.
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return highest ? rolls[a].value > rolls[b].value : rolls[a].value < rolls[b].value;
    });

    std::size_t limit = std::min(order.size(), static_cast<std::size_t>(std::max<Value>(keepCount, 0)));
    std::vector<bool> kept(rolls.size(), false);
    for (std::size_t i = 0; i < limit; ++i) {
        kept[order[i]] = true;
    }
    return kept;
}

} // namespace roller
