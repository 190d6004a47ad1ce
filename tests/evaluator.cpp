#include "evaluator.hpp"
#include "dice_roller.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <limits>
#include <numeric>
#include <vector>

#undef NDEBUG
#include <cassert>

using namespace roller;
using roller::testing::ScriptedRandomSource;
using roller::testing::throws;

std::vector<Value> roll_values(ResultNode const& result)
{
	std::vector<Value> values;
	for (auto const& roll : result.rolls())
		values.push_back(roll.value);
	return values;
}

void test_constant()
{
	ScriptedRandomSource random(std::vector<Value>{});
	Evaluator evaluator(random);
	auto const result = evaluator.evaluate(makeConstant(-42));
	assert(result.value().asScalar() == -42);
	assert(result.rolls().empty());
	assert(result.children().empty());
	assert(random.calls.empty());
}

void test_dice_term_rolls()
{
	MersenneRandomSource random(42);
	Evaluator evaluator(random);
	auto const dice = makeDice(5, 6);
	for (int i = 0; i < 200; ++i) {
		auto const result = evaluator.evaluate(dice);
		assert(result.rolls().size() == 5);
		Value sum = 0;
		for (auto const& roll : result.rolls()) {
			assert(roll.value >= 1 && roll.value <= 6);
			assert(roll.sides == 6);
			sum += roll.value;
		}
		assert(result.value().asScalar() == sum);
	}

	// d1 всегда даёт единицу
	auto const single = makeDice(1, 1);
	for (int i = 0; i < 20; ++i)
		assert(evaluator.evaluate(single).value().asScalar() == 1);
}

void test_dice_requested_ranges()
{
	ScriptedRandomSource random({6, 6, 6, 1, -1, 0, 1});
	Evaluator evaluator(random);

	auto const standard = evaluator.evaluate(makeDice(3, 6));
	assert(standard.value().asScalar() == 18);
	assert((roll_values(standard) == std::vector<Value>{6, 6, 6}));

	auto const fudge = evaluator.evaluate(makeFudgeDice(4));
	assert(fudge.value().asScalar() == 1);
	assert(fudge.rolls()[0].sides == 3);

	assert(random.calls.size() == 7);
	for (std::size_t i = 0; i < 3; ++i)
		assert((random.calls[i] == std::pair<Value, Value>{1, 6}));
	for (std::size_t i = 3; i < 7; ++i)
		assert((random.calls[i] == std::pair<Value, Value>{-1, 1}));
}

void test_keep_highest_and_lowest()
{
	MersenneRandomSource random(7);
	Evaluator evaluator(random);
	auto const highest = makeModifier(ModifierKind::KeepHighest, 2, makeDice(5, 20));
	auto const lowest = makeModifier(ModifierKind::KeepLowest, 2, makeDice(5, 20));

	for (int i = 0; i < 100; ++i) {
		auto const high = evaluator.evaluate(highest);
		auto sorted = roll_values(high);
		std::sort(sorted.begin(), sorted.end(), std::greater<Value>());
		assert(high.value().asScalar() == sorted[0] + sorted[1]);
		assert(high.rolls().size() == 5);
		assert(std::count(high.kept().begin(), high.kept().end(), true) == 2);

		auto const low = evaluator.evaluate(lowest);
		auto ascending = roll_values(low);
		std::sort(ascending.begin(), ascending.end());
		assert(low.value().asScalar() == ascending[0] + ascending[1]);
	}
}

void test_modifier_keeps_roll_order()
{
	ScriptedRandomSource random({1, 2, 3, 4, 1, 2, 3, 4, 5, -1, 0, 1, -1});
	Evaluator evaluator(random);

	auto const dropLowest = evaluator.evaluate(makeModifier(ModifierKind::DropLowest, 1, makeDice(4, 6)));
	assert(dropLowest.value().asScalar() == 9);
	assert((roll_values(dropLowest) == std::vector<Value>{1, 2, 3, 4}));
	assert((dropLowest.kept() == std::vector<bool>{false, true, true, true}));
	assert(dropLowest.children().size() == 1);
	assert((roll_values(dropLowest.children()[0]) == std::vector<Value>{1, 2, 3, 4}));
	assert(dropLowest.children()[0].value().asScalar() == 10);

	auto const keepHighest = evaluator.evaluate(makeModifier(ModifierKind::KeepHighest, 3, makeDice(5, 8)));
	assert(keepHighest.value().asScalar() == 12);

	auto const keepLowest = evaluator.evaluate(makeModifier(ModifierKind::KeepLowest, 2, makeFudgeDice(4)));
	assert(keepLowest.value().asScalar() == -2);
	assert((keepLowest.kept() == std::vector<bool>{true, false, false, true}));
}

void test_tie_break_is_stable()
{
	ScriptedRandomSource random({5, 5, 3, 3, 5, 3});
	Evaluator evaluator(random);

	auto const highest = evaluator.evaluate(makeModifier(ModifierKind::KeepHighest, 1, makeDice(3, 6)));
	assert(highest.value().asScalar() == 5);
	assert((highest.kept() == std::vector<bool>{true, false, false}));

	auto const lowest = evaluator.evaluate(makeModifier(ModifierKind::KeepLowest, 1, makeDice(3, 6)));
	assert(lowest.value().asScalar() == 3);
	assert((lowest.kept() == std::vector<bool>{true, false, false}));

	assert((selectKept({{4, 6}, {4, 6}, {4, 6}}, 2, true) == std::vector<bool>{true, true, false}));

	// Отбрасывание использует тот же порядок: из равных первым остаётся более ранний бросок
	ScriptedRandomSource dropping({5, 5, 3, 3, 3, 5});
	Evaluator dropEvaluator(dropping);

	auto const dropHighest = dropEvaluator.evaluate(makeModifier(ModifierKind::DropHighest, 1, makeDice(3, 6)));
	assert(dropHighest.value().asScalar() == 8);
	assert((dropHighest.kept() == std::vector<bool>{true, false, true}));

	auto const dropLowest = dropEvaluator.evaluate(makeModifier(ModifierKind::DropLowest, 1, makeDice(3, 6)));
	assert(dropLowest.value().asScalar() == 8);
	assert((dropLowest.kept() == std::vector<bool>{true, false, true}));
}

void test_keep_all_equals_plain_sum()
{
	MersenneRandomSource random(1234);
	Evaluator evaluator(random);
	auto const all = makeModifier(ModifierKind::KeepHighest, 4, makeDice(4, 10));
	for (int i = 0; i < 50; ++i) {
		auto const result = evaluator.evaluate(all);
		auto const values = roll_values(result);
		assert(result.value().asScalar() == std::accumulate(values.begin(), values.end(), Value{0}));
	}

	// Отбросить все кубики допустимо, сумма равна нулю
	ScriptedRandomSource scripted({2, 3});
	Evaluator dropAll(scripted);
	assert(dropAll.evaluate(makeModifier(ModifierKind::DropHighest, 2, makeDice(2, 6))).value().asScalar() == 0);
}

void test_arithmetic()
{
	ScriptedRandomSource random(std::vector<Value>{});
	Evaluator evaluator(random);
	auto value = [&](BinaryOperator op, Value a, Value b) {
		return evaluator.evaluate(makeBinary(op, makeConstant(a), makeConstant(b))).value().asScalar();
	};

	assert(value(BinaryOperator::Add, 5, 3) == 8);
	assert(value(BinaryOperator::Add, -4, 4) == 0);
	assert(value(BinaryOperator::Sub, 3, 5) == -2);
	assert(value(BinaryOperator::Mul, -4, 0) == 0);
	assert(value(BinaryOperator::Mul, 6, 7) == 42);

	// Деление отбрасывает дробную часть в сторону нуля
	assert(value(BinaryOperator::Div, 5, 2) == 2);
	assert(value(BinaryOperator::Div, 7, -2) == -3);
	assert(value(BinaryOperator::Div, -7, 2) == -3);
	assert(value(BinaryOperator::Div, -4, 2) == -2);
	assert(value(BinaryOperator::Div, 0, 10) == 0);

	// Выход за пределы Value сообщается, а не заворачивается
	auto const max = std::numeric_limits<Value>::max();
	auto const min = std::numeric_limits<Value>::min();
	auto overflows = [&](BinaryOperator op, Value a, Value b) {
		return throws<EvaluationError>([&] { value(op, a, b); });
	};
	assert(overflows(BinaryOperator::Add, max, 1));
	assert(overflows(BinaryOperator::Add, min, -1));
	assert(overflows(BinaryOperator::Sub, -max, 2));
	assert(overflows(BinaryOperator::Sub, max, -1));
	assert(overflows(BinaryOperator::Mul, Value{4294967296}, Value{4294967296}));
	assert(overflows(BinaryOperator::Mul, min, -1));
	assert(overflows(BinaryOperator::Mul, -1, min));
	assert(overflows(BinaryOperator::Mul, max, -2));
	assert(overflows(BinaryOperator::Div, min, -1));
	assert(value(BinaryOperator::Add, max, min) == -1);
	assert(value(BinaryOperator::Sub, -max, 1) == min);
	assert(value(BinaryOperator::Mul, -1, max) == -max);
	assert(value(BinaryOperator::Mul, min, 1) == min);
	assert(value(BinaryOperator::Mul, Value{-4294967296}, Value{2147483648}) == min);
	assert(random.calls.empty());
}

void test_dice_sum_overflow()
{
	auto const max = std::numeric_limits<Value>::max();

	ScriptedRandomSource random({max, max});
	Evaluator evaluator(random);
	assert(throws<EvaluationError>([&] { evaluator.evaluate(makeDice(2, max)); }));

	// Переполнение внутри броска прерывает и модификатор
	ScriptedRandomSource keep({max, 1});
	Evaluator keepEvaluator(keep);
	assert(throws<EvaluationError>([&] {
		keepEvaluator.evaluate(makeModifier(ModifierKind::KeepHighest, 1, makeDice(2, max)));
	}));

	ScriptedRandomSource large({max});
	Evaluator largeEvaluator(large);
	assert(largeEvaluator.evaluate(makeDice(1, max)).value().asScalar() == max);
}

void test_division_by_zero()
{
	ScriptedRandomSource random({3, 4});
	Evaluator evaluator(random);
	assert(throws<EvaluationError>([&] {
		evaluator.evaluate(makeBinary(BinaryOperator::Div, makeConstant(5), makeConstant(0)));
	}));

	// Делитель, равный нулю после вычисления
	auto const divisor = makeBinary(BinaryOperator::Sub, makeDice(1, 6), makeConstant(3));
	assert(throws<EvaluationError>([&] {
		evaluator.evaluate(makeBinary(BinaryOperator::Div, makeConstant(10), divisor));
	}));
	assert(evaluator.evaluate(makeBinary(BinaryOperator::Div, makeConstant(10), divisor)).value().asScalar() == 10);
}

void test_left_before_right()
{
	ScriptedRandomSource random({4, 8});
	Evaluator evaluator(random);
	auto const result = evaluator.evaluate(makeBinary(BinaryOperator::Sub, makeDice(1, 4), makeDice(1, 8)));
	assert(result.value().asScalar() == -4);
	assert((random.calls[0] == std::pair<Value, Value>{1, 4}));
	assert((random.calls[1] == std::pair<Value, Value>{1, 8}));
	assert(result.children().size() == 2);
	assert(result.children()[0].value().asScalar() == 4);
	assert(result.children()[1].value().asScalar() == 8);
}

void test_list_expansion()
{
	MersenneRandomSource random(99);
	Evaluator evaluator(random);
	auto const expression = makeList(4, makeDice(10, 20));
	auto const result = evaluator.evaluate(expression);

	assert(result.value().isList());
	assert(result.value().items().size() == 4);
	assert(result.children().size() == 4);
	for (std::size_t i = 0; i < 4; ++i) {
		assert(result.children()[i].rolls().size() == 10);
		assert(result.value().items()[i].asScalar() == result.children()[i].value().asScalar());
	}

	// Каждое повторение бросает заново
	bool differs = false;
	for (std::size_t i = 1; i < 4; ++i)
		differs = differs || roll_values(result.children()[i]) != roll_values(result.children()[0]);
	assert(differs);
}

void test_nested_list_and_sequence()
{
	ScriptedRandomSource random({1, 2, 3, 4, 5, 6, 7});
	DiceRoller diceRoller(random);

	auto const grid = diceRoller.roll("2 3 d6");
	assert(grid.value().format() == "[[1, 2, 3], [4, 5, 6]]");
	assert(grid.children()[1].children()[2].value().asScalar() == 6);

	auto const sequence = diceRoller.roll("d8, 10");
	assert(sequence.value().format() == "[7, 10]");
	assert(sequence.children().size() == 2);
}

void test_failure_consumes_whole_roll()
{
	ScriptedRandomSource random({3, 3});
	DiceRoller diceRoller(random);
	assert(throws<EvaluationError>([&] { diceRoller.roll("2 (1d6 / (1d6 - 3))"); }));
	assert(throws<SemanticError>([&] { diceRoller.roll("3d6 kh4"); }));
	assert(throws<SyntaxError>([&] { diceRoller.roll("2d"); }));
	// Ошибки разбора не трогают источник случайности
	assert(random.consumed() == 2);
}

int main()
{
	try {
		test_constant();
		test_dice_term_rolls();
		test_dice_requested_ranges();
		test_keep_highest_and_lowest();
		test_modifier_keeps_roll_order();
		test_tie_break_is_stable();
		test_keep_all_equals_plain_sum();
		test_arithmetic();
		test_dice_sum_overflow();
		test_division_by_zero();
		test_left_before_right();
		test_list_expansion();
		test_nested_list_and_sequence();
		test_failure_consumes_whole_roll();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	} catch (...) {
		std::cerr << "Unknown Error\n";
		return -1;
	}
	return 0;
}
