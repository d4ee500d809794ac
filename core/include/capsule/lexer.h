#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace capsule {

enum class Tok {
    IDENT,
    INT,
    FLOAT,
    STRING,
    NEWLINE,
    END,

    LPAREN, RPAREN, LBRACKET, RBRACKET, LBRACE, RBRACE,
    COMMA, DOT, COLON, SEMI, ARROW,

    ASSIGN, PLUS_ASSIGN, MINUS_ASSIGN, STAR_ASSIGN, SLASH_ASSIGN,
    PLUS, MINUS, STAR, SLASH, SLASH_SLASH, PERCENT, STAR_STAR,
    EQ, NE, LT, LE, GT, GE,

    // keywords
    LET, FN, RETURN, IF, ELSE, WHILE, FOR, IN, BREAK, CONTINUE,
    TRUE, FALSE, NUL, AND, OR, NOT, IMPORT, FROM, AS,
};

struct Token {
    Tok type{Tok::END};
    std::string text;   // identifier name or decoded string literal
    int64_t ival{0};
    double fval{0.0};
    int line{1};
    int col{1};
};

const char* tok_name(Tok t);

// Tokenize capsule script source. Newlines directly inside () and [] are
// dropped (a { } nested within them makes newlines significant again);
// all other newlines become NEWLINE tokens. Throws SyntaxError.
std::vector<Token> tokenize(const std::string& src);

} // namespace capsule
