#include "parser.hpp"

#include "errors.hpp"
#include "tokenizer.hpp"

namespace roller {

namespace {
// Токены, с которых может начинаться выражение после количества повторов
bool startsOperand(TokenType type) {
    return type == TokenType::Number || type == TokenType::Dice || type == TokenType::LParen;
}
}

Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

// Запуск процесса парсинга
// Ожидает, что вся строка будет полностью разобрана
ParseNode Parser::parse() {
    auto root = parseSequence();
    if (!isAtEnd()) {
        throw SyntaxError("Неожиданный хвост выражения", peek().position);
    }
    return root;
}

const Token& Parser::peek() const {
    return tokens[current];
}

const Token& Parser::peekNext() const {
    return isAtEnd() ? tokens[current] : tokens[current + 1];
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && tokens[current].type == type) {
        ++current;
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type, const std::string& errorMessage) {
    if (match(type)) {
        return tokens[current - 1];
    }
    throw SyntaxError(errorMessage, peek().position);
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

void Parser::unexpected() const {
    if (isAtEnd()) {
        throw SyntaxError("Неожиданный конец выражения", peek().position);
    }
    throw SyntaxError("Неожиданный токен '" + peek().text + "'", peek().position);
}

// Грамматика: Sequence -> List { "," List }
ParseNode Parser::parseSequence() {
    ParseNode node{ParseRule::Sequence, "", peek().position, {}};
    node.children.push_back(parseList());
    while (match(TokenType::Comma)) {
        node.children.push_back(parseList());
    }
    return node;
}

// Грамматика: List -> Number WS List | Expression
// Число, за которым через пробел начинается новое выражение,
// задаёт количество повторов остатка строки
ParseNode Parser::parseList() {
    const Token& first = peek();
    if (first.type == TokenType::Number && peekNext().spaceBefore && startsOperand(peekNext().type)) {
        ++current;
        ParseNode node{ParseRule::ListExpression, first.text, first.position, {}};
        node.children.push_back({ParseRule::Integer, first.text, first.position, {}});
        node.children.push_back(parseList());
        return node;
    }

    ParseNode node{ParseRule::ListExpression, "", first.position, {}};
    node.children.push_back(parseExpression());
    return node;
}

// Грамматика: Expression -> Term { ("+" | "-") Term }
ParseNode Parser::parseExpression() {
    auto node = parseTerm();
    while (peek().type == TokenType::Plus || peek().type == TokenType::Minus) {
        const Token& op = tokens[current++];
        auto right = parseTerm();
        ParseNode binary{ParseRule::BinaryOp, op.text, op.position, {}};
        binary.children.push_back(std::move(node));
        binary.children.push_back(std::move(right));
        node = std::move(binary);
    }
    return node;
}

// Грамматика: Term -> Factor { ("*" | "/") Factor }
ParseNode Parser::parseTerm() {
    auto node = parseFactor();
    while (peek().type == TokenType::Star || peek().type == TokenType::Slash) {
        const Token& op = tokens[current++];
        auto right = parseFactor();
        ParseNode binary{ParseRule::BinaryOp, op.text, op.position, {}};
        binary.children.push_back(std::move(node));
        binary.children.push_back(std::move(right));
        node = std::move(binary);
    }
    return node;
}

// Грамматика: Factor -> Dice { Directive } | "-"? Number | "(" Expression ")"
ParseNode Parser::parseFactor() {
    // Бросок кубиков
    if (peek().type == TokenType::Dice) {
        return parseDiceRoll();
    }

    // Число
    if (match(TokenType::Number)) {
        const auto& token = tokens[current - 1];
        return {ParseRule::Integer, token.text, token.position, {}};
    }

    // Отрицательное число: минус вплотную к цифрам
    if (peek().type == TokenType::Minus && peekNext().type == TokenType::Number &&
        !peekNext().spaceBefore) {
        const auto& sign = tokens[current];
        const auto& digits = tokens[current + 1];
        current += 2;
        return {ParseRule::Integer, "-" + digits.text, sign.position, {}};
    }

    // Группировка скобками
    if (peek().type == TokenType::LParen) {
        const auto& open = tokens[current++];
        ParseNode node{ParseRule::Parens, "", open.position, {}};
        node.children.push_back(parseExpression());
        consume(TokenType::RParen, "Ожидалась закрывающая скобка");
        return node;
    }

    unexpected();
}

// Разбор броска, например: 4d6 dl1
ParseNode Parser::parseDiceRoll() {
    const auto& dice = tokens[current++];
    ParseNode node{ParseRule::DiceRoll, dice.text, dice.position, {}};
    while (match(TokenType::Directive)) {
        const auto& directive = tokens[current - 1];
        node.children.push_back({ParseRule::Directive, directive.text, directive.position, {}});
    }
    return node;
}

ParseNode parse(const std::string& rollString) {
    Tokenizer tokenizer(rollString);
    Parser parser(tokenizer.tokenize());
    return parser.parse();
}

} // namespace roller
