/*
 * Lexer tests - HTTPScript
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <httpscript/lex/lexer.hpp>
#include <httpscript/lex/tokens.hpp>

using namespace httpscript;

static std::vector<TokenKind> kinds_of(const TokenStream& ts) {
    std::vector<TokenKind> kinds;
    for (auto& t : ts) kinds.push_back(t.kind);
    return kinds;
}

TEST(LexerBasic, LineClassification) {
    std::string src = "### first\n# comment\n@host = a.com\n\nGET http://{{host}}/x\nAccept: */*\n> {%\n  client.test('a', () => {});\n%}\n";
    Lexer lx(src);
    auto ts = lx.run();
    std::vector<TokenKind> expected = {TokenKind::Separator, TokenKind::Comment, TokenKind::Declaration,
                                       TokenKind::Blank, TokenKind::Text, TokenKind::Text,
                                       TokenKind::ResponseHandler, TokenKind::Eof};
    EXPECT_EQ(kinds_of(ts), expected);
    EXPECT_EQ(ts[6].lexeme, "client.test('a', () => {});");
    EXPECT_EQ(ts[4].lexeme, "GET http://{{host}}/x");
}

TEST(LexerBasic, SeparatorAndCommentPrefixes) {
    Lexer lx("####\n#x\n  # indented\n");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 4u);
    EXPECT_EQ(ts[0].kind, TokenKind::Separator);
    EXPECT_EQ(ts[1].kind, TokenKind::Comment);
    EXPECT_EQ(ts[2].kind, TokenKind::Comment);
}

TEST(LexerHandlers, PreHandlerAndXmlBody) {
    Lexer lx("  < {% request.variables.set('a', 1) %}\n<root/>\n");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 3u);
    EXPECT_EQ(ts[0].kind, TokenKind::PreHandler);
    EXPECT_EQ(ts[0].lexeme, "request.variables.set('a', 1)");
    EXPECT_EQ(ts[1].kind, TokenKind::Text);
}

TEST(LexerHandlers, ScriptMayContainBlankAndHashLines) {
    Lexer lx("> {%\n\n# not a comment\nclient.log('%')\n%}");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 2u);
    EXPECT_EQ(ts[0].kind, TokenKind::ResponseHandler);
    EXPECT_EQ(ts[0].lexeme, "# not a comment\nclient.log('%')");
}

TEST(LexerErrors, UnterminatedHandler) {
    Lexer lx("GET x\n> {% client.log(1)\n");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 3u);
    EXPECT_EQ(ts[1].kind, TokenKind::Invalid);
    EXPECT_EQ(ts[2].kind, TokenKind::Eof);
}

TEST(LexerErrors, TextAfterHandler) {
    Lexer lx("> {% a %} b\n");
    auto ts = lx.run();
    EXPECT_EQ(ts[0].kind, TokenKind::Invalid);
}

TEST(LexerCrlf, CarriageReturnsStripped) {
    Lexer lx("GET x\r\n\r\nbody\r\n");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 4u);
    EXPECT_EQ(ts[0].lexeme, "GET x");
    EXPECT_EQ(ts[1].kind, TokenKind::Blank);
    EXPECT_EQ(ts[2].lexeme, "body");
}
