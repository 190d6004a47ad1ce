#include "result.hpp"

#include <stdexcept>
#include <variant>

namespace roller {

namespace {
// Набор лямбд для std::visit
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string joinValues(const std::vector<Value>& values, const std::string& separator) {
    std::string result;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += std::to_string(values[i]);
    }
    return result;
}

std::string indent(std::size_t depth) {
    return std::string(depth * 2, ' ');
}
}

ResultValue ResultValue::scalar(Value value) {
    ResultValue result;
    result.number = value;
    return result;
}

ResultValue ResultValue::list(std::vector<ResultValue> items) {
    ResultValue result;
    result.listValued = true;
    result.elements = std::move(items);
    return result;
}

Value ResultValue::asScalar() const {
    if (listValued) {
        throw std::logic_error("Значение является списком, а не числом");
    }
    return number;
}

const std::vector<ResultValue>& ResultValue::items() const {
    if (!listValued) {
        throw std::logic_error("Значение является числом, а не списком");
    }
    return elements;
}

std::string ResultValue::format() const {
    if (!listValued) {
        return std::to_string(number);
    }
    std::string result = "[";
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += elements[i].format();
    }
    return result + "]";
}

ResultNode::ResultNode(ExpressionPtr source, ResultValue value, std::vector<Roll> rolls,
                       std::vector<bool> kept, std::vector<ResultNode> children)
    : source(std::move(source)),
      computed(std::move(value)),
      rawRolls(std::move(rolls)),
      keptFlags(std::move(kept)),
      childResults(std::move(children)) {}

std::string ResultNode::render() const {
    std::string out;
    renderInto(out, 0);
    return out;
}

// Каждый уровень вложенности сдвигается на два пробела
void ResultNode::renderInto(std::string& out, std::size_t depth) const {
    const std::string prefix = indent(depth);

    auto renderBlocks = [&]() {
        out += prefix + "  Results: " + computed.format() + "\n";
        for (std::size_t i = 0; i < childResults.size(); ++i) {
            out += prefix + "  " + std::to_string(i) + ": \n";
            childResults[i].renderInto(out, depth + 2);
        }
    };

    std::visit(Overloaded{
        [&](const ListExpansion& list) {
            std::string count = std::to_string(list.count);
            out += prefix + "List Expansion: " + source->text() + "\n";
            out += prefix + "  Count: " + count + " => " + count + "\n";
            out += prefix + "  Expression: " + list.body->text() + "\n";
            renderBlocks();
        },
        [&](const Sequence&) {
            out += prefix + "Sequence: " + source->text() + "\n";
            renderBlocks();
        },
        [&](const auto&) {
            out += prefix + trace() + "\n";
        }
    }, source->node);
}

std::string ResultNode::trace() const {
    if (computed.isList()) {
        throw std::logic_error("Однострочная запись доступна только для числовых результатов");
    }

    const std::string valueText = computed.format();
    std::vector<std::string> stages{source->text()};

    std::string withRolls = substituted();
    if (withRolls != stages.back()) {
        stages.push_back(withRolls);
    }
    std::string step = reduced();
    if (!step.empty() && step != stages.back() && step != valueText) {
        stages.push_back(step);
    }

    std::string line;
    for (std::size_t i = 0; i < stages.size(); ++i) {
        if (i > 0) {
            line += " => ";
        }
        line += stages[i];
    }
    if (stages.back() != valueText) {
        line += " = " + valueText;
    }
    return line;
}

std::string ResultNode::substituted() const {
    return std::visit(Overloaded{
        [&](const DiceTerm&) -> std::string { return formatRolls(rawRolls); },
        [&](const Modifier&) -> std::string { return formatRolls(rawRolls); },
        [&](const BinaryOp& binary) -> std::string {
            return "(" + childResults[0].substituted() + " " + operatorSymbol(binary.op) + " " +
                   childResults[1].substituted() + ")";
        },
        [&](const Constant&) -> std::string { return source->text(); },
        [&](const ListExpansion&) -> std::string { return source->text(); },
        [&](const Sequence&) -> std::string { return source->text(); }
    }, source->node);
}

std::string ResultNode::reduced() const {
    return std::visit(Overloaded{
        [&](const DiceTerm&) -> std::string {
            std::vector<Value> values;
            for (const auto& roll : rawRolls) {
                values.push_back(roll.value);
            }
            return joinValues(values, " + ");
        },
        // Складываются только оставленные кубики, в порядке броска
        [&](const Modifier&) -> std::string {
            std::vector<Value> values;
            for (std::size_t i = 0; i < rawRolls.size(); ++i) {
                if (keptFlags[i]) {
                    values.push_back(rawRolls[i].value);
                }
            }
            return joinValues(values, " + ");
        },
        [&](const BinaryOp& binary) -> std::string {
            return childResults[0].value().format() + " " + operatorSymbol(binary.op) + " " +
                   childResults[1].value().format();
        },
        [&](const Constant&) -> std::string { return ""; },
        [&](const ListExpansion&) -> std::string { return ""; },
        [&](const Sequence&) -> std::string { return ""; }
    }, source->node);
}

std::string formatRolls(const std::vector<Roll>& rolls) {
    std::vector<Value> values;
    values.reserve(rolls.size());
    for (const auto& roll : rolls) {
        values.push_back(roll.value);
    }
    return "[" + joinValues(values, ", ") + "]";
}

} // namespace roller
