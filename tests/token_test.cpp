#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "token.hpp"

using lex::Token;
using lex::TokenType;

TEST(TokenTest, TypeNames) {
    EXPECT_STREQ(lex::tokenTypeName(TokenType::End), "END_OF_INPUT");
    EXPECT_STREQ(lex::tokenTypeName(TokenType::Identifier), "IDENTIFIER");
    EXPECT_STREQ(lex::tokenTypeName(TokenType::Number), "NUMBER");
    EXPECT_STREQ(lex::tokenTypeName(TokenType::Plus), "PLUS");
    EXPECT_STREQ(lex::tokenTypeName(TokenType::Minus), "MINUS");
    EXPECT_STREQ(lex::tokenTypeName(TokenType::Star), "STAR");
    EXPECT_STREQ(lex::tokenTypeName(TokenType::Slash), "SLASH");
    EXPECT_STREQ(lex::tokenTypeName(TokenType::LParen), "LPAREN");
    EXPECT_STREQ(lex::tokenTypeName(TokenType::RParen), "RPAREN");
}

TEST(TokenTest, StreamOutput) {
    std::ostringstream out;
    out << Token{TokenType::Identifier, "var", 0, std::nullopt};
    EXPECT_EQ(out.str(), "Token{IDENTIFIER, \"var\", line 0}");
}

TEST(TokenTest, StreamOutputWithLiteral) {
    std::ostringstream out;
    out << Token{TokenType::Number, "7", 2, 7};
    EXPECT_EQ(out.str(), "Token{NUMBER, \"7\", line 2, literal 7}");
}

TEST(TokenTest, EqualityComparesAllFields) {
    Token base{TokenType::Number, "1", 0, std::nullopt};
    EXPECT_EQ(base, (Token{TokenType::Number, "1", 0, std::nullopt}));
    EXPECT_NE(base, (Token{TokenType::Identifier, "1", 0, std::nullopt}));
    EXPECT_NE(base, (Token{TokenType::Number, "2", 0, std::nullopt}));
    EXPECT_NE(base, (Token{TokenType::Number, "1", 1, std::nullopt}));
    EXPECT_NE(base, (Token{TokenType::Number, "1", 0, 1}));
}

TEST(TokenTest, DefaultIsEnd) {
    Token token;
    EXPECT_EQ(token.type, TokenType::End);
    EXPECT_TRUE(token.lexeme.empty());
    EXPECT_EQ(token.line, 0u);
}
