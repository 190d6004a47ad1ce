#include "user_input.hpp"
#include "console.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace {
// Бросок по умолчанию, если строка не задана
constexpr const char* kDefaultRoll = "1d20";

// Удаление пробелов по краям
std::string trim(std::string input) {
    input.erase(0, input.find_first_not_of(" \t"));
    input.erase(input.find_last_not_of(" \t") + 1);
    return input;
}
}

RollOptions parseArguments(const std::vector<std::string>& arguments) {
    RollOptions options;
    std::vector<std::string> words;

    for (std::size_t i = 0; i < arguments.size(); ++i) {
        const std::string& argument = arguments[i];
        if (argument == "-v" || argument == "--verbose") {
            options.verbose = true;
        } else if (argument == "--seed") {
            if (i + 1 >= arguments.size()) {
                throw std::runtime_error("После --seed ожидалось число");
            }
            options.seed = parseSeed(arguments[++i]);
        } else {
            words.push_back(argument);
        }
    }

    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            options.rollString += " ";
        }
        options.rollString += words[i];
    }
    return options;
}

std::uint64_t parseSeed(const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::runtime_error("Некорректное значение зерна: " + value);
    }
    try {
        return std::stoull(value);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное значение зерна: " + value);
    }
}

std::string readRollString() {
    std::cout << Color::BOLD << "Введите бросок (Enter — " << kDefaultRoll << "): " << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод завершён");
    }

    input = trim(std::move(input));
    return input.empty() ? kDefaultRoll : input;
}

bool askContinue() {
    std::cout << Color::BOLD << "Бросить еще раз? (y/n): " << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        return false;
    }

    // Удаление пробелов и приведение к нижнему регистру
    input = trim(std::move(input));
    std::transform(input.begin(), input.end(), input.begin(), ::tolower);

    return (input == "y" || input == "yes" || input == "д" || input == "да");
}
