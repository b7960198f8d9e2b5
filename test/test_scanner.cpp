#include <gtest/gtest.h>
#include <vector>
#include "lx_scanner.hpp"

using namespace loxvm;

namespace {

std::vector<TokenType> types_of(std::string_view source) {
    std::vector<TokenType> types;
    for (const Token& token : Scanner(source).tokenize_all()) {
        types.push_back(token.type);
    }
    return types;
}

} // namespace

TEST(ScannerTests, WhitespaceAndCommentsOnlyYieldEof) {
    auto tokens = Scanner("    \t  \n // \r\n \t   ").tokenize_all();
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::Eof);
    EXPECT_EQ(tokens[0].line, 3u);
    EXPECT_TRUE(tokens[0].lexeme.empty());
}

TEST(ScannerTests, EmptySourceIsEofOnLineOne) {
    Scanner scanner("");
    Token token = scanner.next_token();
    EXPECT_EQ(token.type, TokenType::Eof);
    EXPECT_EQ(token.line, 1u);
    // Stays at Eof
    EXPECT_EQ(scanner.next_token().type, TokenType::Eof);
}

TEST(ScannerTests, Punctuation) {
    EXPECT_EQ(types_of("(){},.-+;/*"),
              (std::vector<TokenType>{
                  TokenType::LeftParen, TokenType::RightParen,
                  TokenType::LeftBrace, TokenType::RightBrace,
                  TokenType::Comma, TokenType::Dot, TokenType::Minus,
                  TokenType::Plus, TokenType::Semicolon, TokenType::Slash,
                  TokenType::Star, TokenType::Eof}));
}

TEST(ScannerTests, OneAndTwoCharacterOperators) {
    EXPECT_EQ(types_of("! != = == > >= < <="),
              (std::vector<TokenType>{
                  TokenType::Bang, TokenType::BangEqual,
                  TokenType::Equal, TokenType::EqualEqual,
                  TokenType::Greater, TokenType::GreaterEqual,
                  TokenType::Less, TokenType::LessEqual,
                  TokenType::Eof}));
}

TEST(ScannerTests, KeywordsAndIdentifiers) {
    EXPECT_EQ(types_of("and class else false for fun if nil or print return super this true var while"),
              (std::vector<TokenType>{
                  TokenType::And, TokenType::Class, TokenType::Else,
                  TokenType::False, TokenType::For, TokenType::Fun,
                  TokenType::If, TokenType::Nil, TokenType::Or,
                  TokenType::Print, TokenType::Return, TokenType::Super,
                  TokenType::This, TokenType::True, TokenType::Var,
                  TokenType::While, TokenType::Eof}));

    auto tokens = Scanner("classy _under score9").tokenize_all();
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].type, TokenType::Identifier);
    EXPECT_EQ(tokens[0].lexeme, "classy");
    EXPECT_EQ(tokens[1].lexeme, "_under");
    EXPECT_EQ(tokens[2].lexeme, "score9");
}

TEST(ScannerTests, NumberLiterals) {
    auto tokens = Scanner("123 4.5 6.").tokenize_all();
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].lexeme, "123");
    EXPECT_EQ(tokens[1].lexeme, "4.5");
    // A trailing dot is not part of the number
    EXPECT_EQ(tokens[2].lexeme, "6");
    EXPECT_EQ(tokens[3].type, TokenType::Dot);
}

TEST(ScannerTests, StringLexemeExcludesQuotes) {
    auto tokens = Scanner("\"hello world\"").tokenize_all();
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::String);
    EXPECT_EQ(tokens[0].lexeme, "hello world");
}

TEST(ScannerTests, MultiLineStringAdvancesLine) {
    auto tokens = Scanner("\"a\nb\" x").tokenize_all();
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].lexeme, "a\nb");
    EXPECT_EQ(tokens[1].line, 2u);
}

TEST(ScannerTests, UnterminatedStringIsErrorToken) {
    auto tokens = Scanner("\"never closed").tokenize_all();
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::Error);
    EXPECT_EQ(tokens[0].lexeme, "Unterminated string.");
    EXPECT_EQ(tokens[1].type, TokenType::Eof);
}

TEST(ScannerTests, UnexpectedCharacterIsErrorToken) {
    auto tokens = Scanner("@ 1").tokenize_all();
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::Error);
    EXPECT_EQ(tokens[0].lexeme, "Unexpected character.");
    EXPECT_EQ(tokens[1].type, TokenType::Number);
}

TEST(ScannerTests, LineNumbersTrackNewlines) {
    auto tokens = Scanner("var a;\n\nprint a; // trailing\nnil").tokenize_all();
    ASSERT_EQ(tokens.size(), 8u);
    EXPECT_EQ(tokens[0].line, 1u);
    EXPECT_EQ(tokens[3].line, 3u);
    EXPECT_EQ(tokens[6].type, TokenType::Nil);
    EXPECT_EQ(tokens[6].line, 4u);
}

TEST(ScannerTests, TokenDescription) {
    auto tokens = Scanner("\n  fun").tokenize_all();
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].to_string(), "Fun 'fun' [line 2]");
    EXPECT_EQ(tokens[1].to_string(), "Eof '' [line 2]");
}
