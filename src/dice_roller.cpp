#include "dice_roller.hpp"

#include "evaluator.hpp"
#include "parser.hpp"
#include "transformer.hpp"

namespace roller {

DiceRoller::DiceRoller(RandomSource& random) : random(random) {}

ExpressionPtr DiceRoller::compile(const std::string& rollString) const {
    // Этап 1-2: Лексический и синтаксический анализ
    ParseNode tree = parse(rollString);

    // Этап 3: Построение дерева вычисления с проверкой значений
    Transformer transformer;
    return transformer.transform(tree);
}

ResultNode DiceRoller::roll(const std::string& rollString) const {
    return roll(compile(rollString));
}

// Этап 4: Вычисление
ResultNode DiceRoller::roll(const ExpressionPtr& expression) const {
    Evaluator evaluator(random);
    return evaluator.evaluate(expression);
}

} // namespace roller
