#include "tokenizer.hpp"

#include "errors.hpp"

#include <cctype>

namespace roller {

namespace {
bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

char lower(char ch) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        bool spaced = skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        char ch = peek();
        Token token;
        switch (ch) {
        // Односимвольные токены
        case '+':
            token = {TokenType::Plus, "+", index};
            advance();
            break;
        case '-':
            token = {TokenType::Minus, "-", index};
            advance();
            break;
        case '*':
            token = {TokenType::Star, "*", index};
            advance();
            break;
        case '/':
            token = {TokenType::Slash, "/", index};
            advance();
            break;
        case '(':
            token = {TokenType::LParen, "(", index};
            advance();
            break;
        case ')':
            token = {TokenType::RParen, ")", index};
            advance();
            break;
        case ',':
            token = {TokenType::Comma, ",", index};
            advance();
            break;
        default:
            // Многосимвольные токены (числа, броски, модификаторы)
            if (isDigit(ch)) {
                token = makeNumberOrDice();
            } else if (std::isalpha(static_cast<unsigned char>(ch))) {
                token = makeWord();
            } else {
                throw SyntaxError(std::string("Недопустимый символ '") + ch + "'", index);
            }
            break;
        }
        token.spaceBefore = spaced;
        tokens.push_back(std::move(token));
    }

    tokens.push_back({TokenType::End, "", index, false});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::peekNext() const {
    return index + 1 < source.size() ? source[index + 1] : '\0';
}

char Tokenizer::advance() {
    return source[index++];
}

bool Tokenizer::skipWhitespace() {
    std::size_t start = index;
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
    return index != start;
}

bool Tokenizer::atDiceSides() const {
    if (isAtEnd() || lower(peek()) != 'd') {
        return false;
    }
    char next = peekNext();
    return isDigit(next) || lower(next) == 'f';
}

void Tokenizer::readDiceSides() {
    advance(); // 'd'
    if (lower(peek()) == 'f') {
        advance();
        return;
    }
    while (!isAtEnd() && isDigit(peek())) {
        advance();
    }
}

// Разбор числового литерала
// Если за цифрами сразу идёт "dN", это бросок с количеством кубиков
Token Tokenizer::makeNumberOrDice() {
    std::size_t start = index;
    while (!isAtEnd() && isDigit(peek())) {
        advance();
    }

    if (atDiceSides()) {
        readDiceSides();
        return {TokenType::Dice, source.substr(start, index - start), start};
    }
    return {TokenType::Number, source.substr(start, index - start), start};
}

// Разбор слова: "d20"/"dF" или модификатор вида [kd][hl]N
Token Tokenizer::makeWord() {
    std::size_t start = index;

    if (atDiceSides()) {
        readDiceSides();
        return {TokenType::Dice, source.substr(start, index - start), start};
    }

    char first = lower(peek());
    char second = lower(peekNext());
    if ((first == 'k' || first == 'd') && (second == 'h' || second == 'l')) {
        advance();
        advance();
        if (isAtEnd() || !isDigit(peek())) {
            throw SyntaxError("Ожидалось количество кубиков после модификатора", index);
        }
        while (!isAtEnd() && isDigit(peek())) {
            advance();
        }
        return {TokenType::Directive, source.substr(start, index - start), start};
    }

    throw SyntaxError("Неизвестное слово в выражении", start);
}

} // namespace roller
