#pragma once

#include <string>
#include <vector>

#include "ast.hpp"

namespace roller {

// Результат одного кубика
struct Roll {
    Value value;
    Value sides;

    bool operator==(const Roll&) const = default;
};

// Значение узла результата: число либо список значений.
// Списки вкладываются для вложенных повторов и последовательностей.
class ResultValue {
public:
    static ResultValue scalar(Value value);
    static ResultValue list(std::vector<ResultValue> items);

    bool isList() const { return listValued; }

    // Выбрасывает std::logic_error для списка
    Value asScalar() const;

    // Выбрасывает std::logic_error для числа
    const std::vector<ResultValue>& items() const;

    // "21" или "[21, 26]"
    std::string format() const;

private:
    bool listValued = false;
    Value number = 0;
    std::vector<ResultValue> elements;
};

// Узел дерева результатов. Повторяет форму дерева вычисления:
// дочерние результаты идут в том же порядке, что и дочерние выражения.
// После создания не изменяется.
class ResultNode {
public:
    ResultNode(ExpressionPtr source, ResultValue value, std::vector<Roll> rolls = {},
               std::vector<bool> kept = {}, std::vector<ResultNode> children = {});

    // Выражение, результатом которого является узел
    const Expression& expression() const { return *source; }
    const ExpressionPtr& sourceExpression() const { return source; }

    const ResultValue& value() const { return computed; }
    const std::vector<Roll>& rolls() const { return rawRolls; }

    // Для модификаторов: какие кубики из rolls() вошли в сумму
    const std::vector<bool>& kept() const { return keptFlags; }

    const std::vector<ResultNode>& children() const { return childResults; }

    // Многострочный отчёт о вычислении
    std::string render() const;

    // Однострочная запись "выражение => подстановка => шаг = значение".
    // Только для узлов с числовым значением.
    std::string trace() const;

private:
    ExpressionPtr source;
    ResultValue computed;
    std::vector<Roll> rawRolls;
    std::vector<bool> keptFlags;
    std::vector<ResultNode> childResults;

    void renderInto(std::string& out, std::size_t depth) const;

    // Выражение с подставленными бросками кубиков
    std::string substituted() const;

    // Собственный шаг узла: "13 + 8"; пусто, если шага нет
    std::string reduced() const;
};

// "[13, 8]"
std::string formatRolls(const std::vector<Roll>& rolls);

} // namespace roller
