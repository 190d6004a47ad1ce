#pragma once

#include <string>
#include <vector>

#include "parse_tree.hpp"
#include "token.hpp"

namespace roller {

// Класс синтаксического анализатора (парсера)
// Строит конкретное дерево разбора из списка токенов.
// Реализует алгоритм рекурсивного спуска.
class Parser {
public:
    // Конструктор принимает список токенов от лексера
    explicit Parser(std::vector<Token> tokens);

    // Основной метод запуска парсинга
    // Возвращает корневой узел Sequence
    // Выбрасывает SyntaxError при синтаксических ошибках
    ParseNode parse();

private:
    const std::vector<Token> tokens; // Список токенов
    std::size_t current = 0;         // Индекс текущего токена

    // Возвращает текущий токен без продвижения
    const Token& peek() const;

    // Возвращает токен, следующий за текущим
    const Token& peekNext() const;

    // Проверяет, соответствует ли текущий токен ожидаемому типу.
    // Если да — сдвигает указатель и возвращает true.
    bool match(TokenType type);

    // Ожидает токен определенного типа, иначе выбрасывает SyntaxError
    const Token& consume(TokenType type, const std::string& errorMessage);

    bool isAtEnd() const;

    // --- Методы рекурсивного спуска (от низкого приоритета к высокому) ---

    // Последовательность через запятую
    ParseNode parseSequence();

    // Список: необязательное количество повторов и выражение
    ParseNode parseList();

    // Разбор выражения (сложение/вычитание)
    ParseNode parseExpression();

    // Разбор слагаемого (умножение/деление)
    ParseNode parseTerm();

    // Разбор множителя (числа, броски, скобки)
    ParseNode parseFactor();

    // Разбор броска вместе с модификаторами
    ParseNode parseDiceRoll();

    // Выбрасывает SyntaxError для текущего токена
    [[noreturn]] void unexpected() const;
};

// Полный разбор строки: токенизация и построение дерева
ParseNode parse(const std::string& rollString);

} // namespace roller
