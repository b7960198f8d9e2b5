#include "lx_scanner.hpp"

namespace loxvm {

namespace {

constexpr char kNoChar = '\0';

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_identifier_start(char c) {
    return c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_identifier_part(char c) {
    return is_identifier_start(c) || is_digit(c);
}

} // namespace

Scanner::Scanner(std::string_view source)
    : source_(source) {}

// ---- Cursor ----

bool Scanner::is_at_end() const {
    return current_ >= source_.size();
}

char Scanner::peek(uint32_t ahead) const {
    size_t at = static_cast<size_t>(current_) + ahead;
    return at < source_.size() ? source_[at] : kNoChar;
}

char Scanner::advance() {
    return source_[current_++];
}

bool Scanner::match(char expected) {
    if (peek() != expected || is_at_end()) return false;
    ++current_;
    return true;
}

std::string_view Scanner::current_lexeme() const {
    return source_.substr(start_, current_ - start_);
}

Token Scanner::make_token(TokenType type) const {
    return Token(type, current_lexeme(), line_);
}

Token Scanner::error_token(const char* message) const {
    return Token(TokenType::Error, std::string_view(message), line_);
}

// Skips blanks, newlines and `//` comments, counting lines as it goes.
void Scanner::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        if (c == '\n') {
            ++line_;
        } else if (c == '/' && peek(1) == '/') {
            while (!is_at_end() && peek() != '\n') ++current_;
            continue;
        } else if (c != ' ' && c != '\t' && c != '\r') {
            return;
        }
        ++current_;
    }
}

// ---- Literals ----

Token Scanner::scan_number() {
    while (is_digit(peek())) advance();

    if (peek() == '.' && is_digit(peek(1))) {
        advance();
        while (is_digit(peek())) advance();
    }

    return make_token(TokenType::Number);
}

Token Scanner::scan_string() {
    while (!is_at_end() && peek() != '"') {
        if (advance() == '\n') ++line_;
    }

    if (is_at_end()) return error_token("Unterminated string.");
    advance();

    // Lexeme without the surrounding quotes; the line is where it ends.
    return Token(TokenType::String, source_.substr(start_ + 1, current_ - start_ - 2), line_);
}

Token Scanner::scan_identifier() {
    while (is_identifier_part(peek())) advance();
    return make_token(TokenUtils::keyword_type(current_lexeme()));
}

Token Scanner::scan_operator(char c) {
    switch (c) {
        case '(': return make_token(TokenType::LeftParen);
        case ')': return make_token(TokenType::RightParen);
        case '{': return make_token(TokenType::LeftBrace);
        case '}': return make_token(TokenType::RightBrace);
        case ';': return make_token(TokenType::Semicolon);
        case ',': return make_token(TokenType::Comma);
        case '.': return make_token(TokenType::Dot);
        case '-': return make_token(TokenType::Minus);
        case '+': return make_token(TokenType::Plus);
        case '/': return make_token(TokenType::Slash);
        case '*': return make_token(TokenType::Star);
        case '!':
            return make_token(match('=') ? TokenType::BangEqual : TokenType::Bang);
        case '=':
            return make_token(match('=') ? TokenType::EqualEqual : TokenType::Equal);
        case '<':
            return make_token(match('=') ? TokenType::LessEqual : TokenType::Less);
        case '>':
            return make_token(match('=') ? TokenType::GreaterEqual : TokenType::Greater);
        default:
            return error_token("Unexpected character.");
    }
}

// ---- Main entry ----

Token Scanner::next_token() {
    skip_whitespace();
    start_ = current_;

    if (is_at_end()) return Token(TokenType::Eof, std::string_view(), line_);

    char c = advance();
    if (is_identifier_start(c)) return scan_identifier();
    if (is_digit(c)) return scan_number();
    if (c == '"') return scan_string();
    return scan_operator(c);
}

std::vector<Token> Scanner::tokenize_all() {
    std::vector<Token> tokens;
    for (Token token = next_token();; token = next_token()) {
        tokens.push_back(token);
        if (token.type == TokenType::Eof) break;
    }
    return tokens;
}

} // namespace loxvm
