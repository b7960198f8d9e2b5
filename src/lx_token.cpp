#include "lx_token.hpp"
#include <unordered_map>

namespace loxvm {

std::string Token::to_string() const {
    std::string result = TokenUtils::token_type_name(type);
    result += " '";
    result += lexeme;
    result += "' [line ";
    result += std::to_string(line);
    result += "]";
    return result;
}

const char* TokenUtils::token_type_name(TokenType type) {
    switch (type) {
        case TokenType::LeftParen: return "LeftParen";
        case TokenType::RightParen: return "RightParen";
        case TokenType::LeftBrace: return "LeftBrace";
        case TokenType::RightBrace: return "RightBrace";
        case TokenType::Comma: return "Comma";
        case TokenType::Dot: return "Dot";
        case TokenType::Minus: return "Minus";
        case TokenType::Plus: return "Plus";
        case TokenType::Semicolon: return "Semicolon";
        case TokenType::Slash: return "Slash";
        case TokenType::Star: return "Star";
        case TokenType::Bang: return "Bang";
        case TokenType::BangEqual: return "BangEqual";
        case TokenType::Equal: return "Equal";
        case TokenType::EqualEqual: return "EqualEqual";
        case TokenType::Greater: return "Greater";
        case TokenType::GreaterEqual: return "GreaterEqual";
        case TokenType::Less: return "Less";
        case TokenType::LessEqual: return "LessEqual";
        case TokenType::Identifier: return "Identifier";
        case TokenType::String: return "String";
        case TokenType::Number: return "Number";
        case TokenType::And: return "And";
        case TokenType::Class: return "Class";
        case TokenType::Else: return "Else";
        case TokenType::False: return "False";
        case TokenType::For: return "For";
        case TokenType::Fun: return "Fun";
        case TokenType::If: return "If";
        case TokenType::Nil: return "Nil";
        case TokenType::Or: return "Or";
        case TokenType::Print: return "Print";
        case TokenType::Return: return "Return";
        case TokenType::Super: return "Super";
        case TokenType::This: return "This";
        case TokenType::True: return "True";
        case TokenType::Var: return "Var";
        case TokenType::While: return "While";
        case TokenType::Error: return "Error";
        case TokenType::Eof: return "Eof";
    }
    return "Unknown";
}

TokenType TokenUtils::keyword_type(std::string_view str) {
    static const std::unordered_map<std::string_view, TokenType> keywords = {
        {"and", TokenType::And},
        {"class", TokenType::Class},
        {"else", TokenType::Else},
        {"false", TokenType::False},
        {"for", TokenType::For},
        {"fun", TokenType::Fun},
        {"if", TokenType::If},
        {"nil", TokenType::Nil},
        {"or", TokenType::Or},
        {"print", TokenType::Print},
        {"return", TokenType::Return},
        {"super", TokenType::Super},
        {"this", TokenType::This},
        {"true", TokenType::True},
        {"var", TokenType::Var},
        {"while", TokenType::While},
    };

    auto it = keywords.find(str);
    if (it != keywords.end()) {
        return it->second;
    }
    return TokenType::Identifier;
}

} // namespace loxvm
