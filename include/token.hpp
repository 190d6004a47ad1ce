#pragma once

#include <cstddef>
#include <string>

namespace roller {

// Типы токенов языка бросков
enum class TokenType {
    Number,     // Целое число без знака: 2, 20
    Dice,       // Бросок кубиков: 3d6, d20, 4dF
    Directive,  // Модификатор броска: kh1, kl2, dh1, dl3
    Plus,
    Minus,
    Star,
    Slash,
    LParen,
    RParen,
    Comma,
    End
};

// Токен с исходным текстом и позицией в строке.
// spaceBefore отмечает, что перед токеном был пробел: так парсер
// отличает разделитель списка от обычного пробела между токенами.
struct Token {
    TokenType type;
    std::string text;
    std::size_t position;
    bool spaceBefore = false;
};

} // namespace roller
