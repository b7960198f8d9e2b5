#pragma once

#include "lx_token.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace loxvm {

// Lazy scanner: each next_token() call produces one token. After the end
// of input every call returns Eof.
class Scanner {
public:
    explicit Scanner(std::string_view source);

    Token next_token();
    std::vector<Token> tokenize_all();

private:
    std::string_view source_;
    uint32_t start_{0};
    uint32_t current_{0};
    uint32_t line_{1};

    char advance();
    char peek(uint32_t ahead = 0) const;
    bool match(char expected);
    bool is_at_end() const;
    std::string_view current_lexeme() const;

    Token make_token(TokenType type) const;
    Token error_token(const char* message) const;

    Token scan_number();
    Token scan_string();
    Token scan_identifier();
    Token scan_operator(char c);

    void skip_whitespace();
};

} // namespace loxvm
