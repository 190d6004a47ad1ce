#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Параметры запуска из командной строки
struct RollOptions {
    bool verbose = false;              // -v: печатать полный разбор броска
    std::optional<std::uint64_t> seed; // --seed N: воспроизводимые броски
    std::string rollString;            // Слова броска, склеенные через пробел
};

// Разбор аргументов командной строки (без имени программы)
// Выбрасывает std::runtime_error при некорректных параметрах
RollOptions parseArguments(const std::vector<std::string>& arguments);

// Безопасный парсинг зерна генератора из строки
std::uint64_t parseSeed(const std::string& value);

// Интерактивный ввод строки броска; пустой ввод означает "1d20"
std::string readRollString();

// Запрос продолжения работы
bool askContinue();
