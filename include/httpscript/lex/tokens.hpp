/*
 * HTTPScript Tokens
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   The lexer works line by line. Every physical line becomes one token,
 *   except handler blocks ("> {% ... %}" / "< {% ... %}") which are folded
 *   into a single token spanning all their lines.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace httpscript {

enum class TokenKind {
    Separator,       // ### [name]
    Comment,         // # ...
    Blank,           // only whitespace
    Declaration,     // @name = value
    PreHandler,      // < {% script %}
    ResponseHandler, // > {% script %}
    Text,            // anything else: request line, header, body
    Invalid,
    Eof
};

struct Token {
    TokenKind kind;
    std::string lexeme;  // line text without EOL; trimmed script for handlers; message for Invalid
    std::size_t pos = 0; // offset of the first char in the source
    std::size_t end = 0; // offset one past the last char (EOL excluded)
};

using TokenStream = std::vector<Token>;

} // namespace httpscript
