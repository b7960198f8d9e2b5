#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace loxvm {

// Token types
enum class TokenType {
    // Single-character tokens
    LeftParen,      // (
    RightParen,     // )
    LeftBrace,      // {
    RightBrace,     // }
    Comma,          // ,
    Dot,            // .
    Minus,          // -
    Plus,           // +
    Semicolon,      // ;
    Slash,          // /
    Star,           // *

    // One or two character tokens
    Bang,           // !
    BangEqual,      // !=
    Equal,          // =
    EqualEqual,     // ==
    Greater,        // >
    GreaterEqual,   // >=
    Less,           // <
    LessEqual,      // <=

    // Literals
    Identifier,
    String,
    Number,

    // Keywords
    And,
    Class,
    Else,
    False,
    For,
    Fun,
    If,
    Nil,
    Or,
    Print,
    Return,
    Super,
    This,
    True,
    Var,
    While,

    Error,
    Eof
};

// Token structure. String lexemes exclude the quotes; error tokens carry
// the message as their lexeme; Eof has an empty lexeme.
struct Token {
    TokenType type;
    std::string_view lexeme;
    uint32_t line;

    Token()
        : type(TokenType::Eof), line(0) {}

    Token(TokenType t, std::string_view lex, uint32_t ln)
        : type(t), lexeme(lex), line(ln) {}

    std::string to_string() const;
};

// Token utilities
class TokenUtils {
public:
    static const char* token_type_name(TokenType type);
    static TokenType keyword_type(std::string_view str);
};

} // namespace loxvm
