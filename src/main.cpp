#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "console.hpp"
#include "dice_roller.hpp"
#include "errors.hpp"
#include "user_input.hpp"

namespace {

    // Бросок одной строки и вывод результата.
    // Возвращает false, если бросок не удался.
    bool rollAndPrint(const roller::DiceRoller& diceRoller, const std::string& rollString, bool verbose) {
        try {
            roller::ResultNode result = diceRoller.roll(rollString);
            if (verbose) {
                std::cout << result.render();
            }
            else {
                std::cout << Color::GREEN << result.value().format() << Color::RESET << "\n";
            }
            return true;
        }
        catch (const roller::SyntaxError& ex) {
            printError(std::string("синтаксис броска \"") + rollString + "\": " + ex.what());
        }
        catch (const roller::SemanticError& ex) {
            printError(std::string("недопустимое значение в \"") + rollString + "\": " + ex.what());
        }
        catch (const roller::EvaluationError& ex) {
            printError(std::string("вычисление \"") + rollString + "\": " + ex.what());
        }
        catch (const std::exception& ex) {
            printError(std::string("бросок \"") + rollString + "\": " + ex.what());
        }
        return false;
    }

    // Интерактивный режим: ввод бросков до отказа пользователя
    void runInteractive(const roller::DiceRoller& diceRoller) {
        printHeader();

        bool continueRolling = true;
        while (continueRolling) {
            try {
                std::string rollString = readRollString();
                std::cout << "\n";
                rollAndPrint(diceRoller, rollString, true);
                std::cout << "\n";
            }
            catch (const std::exception& ex) {
                printError(ex.what());
                break;
            }

            continueRolling = askContinue();
            if (continueRolling) {
                std::cout << "\n";
            }
        }

        std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    RollOptions options;
    try {
        options = parseArguments(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        std::cerr << Color::GRAY << "Использование: dice_roller [-v] [--seed N] [бросок...]"
            << Color::RESET << "\n";
        return 1;
    }

    std::unique_ptr<roller::RandomSource> random;
    if (options.seed) {
        random = std::make_unique<roller::MersenneRandomSource>(*options.seed);
    }
    else {
        random = std::make_unique<roller::MersenneRandomSource>();
    }
    roller::DiceRoller diceRoller(*random);

    if (options.rollString.empty()) {
        runInteractive(diceRoller);
        return 0;
    }

    return rollAndPrint(diceRoller, options.rollString, options.verbose) ? 0 : 1;
}
