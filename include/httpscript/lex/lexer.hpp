/*
 * HTTPScript Lexer
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Splits a .http file into a TokenStream of classified lines. Handler blocks
 *   are recognised here so that the parser never has to look inside script
 *   text ("%}" may appear on any later line). An unterminated handler or text
 *   following "%}" produces an Invalid token.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include "httpscript/lex/tokens.hpp"

namespace httpscript {

class Lexer {
public:
    explicit Lexer(std::string input);
    TokenStream run();

private:
    bool eof() const;
    std::size_t line_end() const;
    Token next();
    Token lex_handler(TokenKind kind, std::size_t start, std::size_t open);

    std::string m_input;
    std::size_t m_pos = 0;
};

// Trim helpers shared by lexer, parser and value expansion.
std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
bool is_blank(const std::string& s);

} // namespace httpscript
