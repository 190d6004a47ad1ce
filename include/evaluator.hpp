#pragma once

#include "ast.hpp"
#include "random_source.hpp"
#include "result.hpp"

namespace roller {

// Рекурсивно вычисляет дерево выражения и строит параллельное
// дерево результатов. Каждый бросок берёт новые значения из источника.
// Дерево выражения не изменяется, поэтому одно и то же дерево можно
// вычислять многократно, в том числе из разных потоков, если у каждого
// потока свой RandomSource.
class Evaluator {
public:
    explicit Evaluator(RandomSource& random);

    // Выбрасывает EvaluationError при ошибке вычисления (деление на ноль)
    ResultNode evaluate(const ExpressionPtr& expression) const;

private:
    RandomSource& random;

    // По одной перегрузке на каждый вариант ExpressionNode
    ResultNode evaluateNode(const ExpressionPtr& source, const Constant& constant) const;
    ResultNode evaluateNode(const ExpressionPtr& source, const DiceTerm& dice) const;
    ResultNode evaluateNode(const ExpressionPtr& source, const Modifier& modifier) const;
    ResultNode evaluateNode(const ExpressionPtr& source, const BinaryOp& binary) const;
    ResultNode evaluateNode(const ExpressionPtr& source, const ListExpansion& list) const;
    ResultNode evaluateNode(const ExpressionPtr& source, const Sequence& sequence) const;
};

// Индексы оставленных кубиков. Сортировка устойчивая: из равных
// значений выбирается брошенный раньше.
std::vector<bool> selectKept(const std::vector<Roll>& rolls, Value keepCount, bool highest);

} // namespace roller
