/*
 * HTTPScript Parser
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include "httpscript/lex/tokens.hpp"
#include "httpscript/parse/ast.hpp"

namespace httpscript {

// Builds the AST from the lexer output. `source` must be the text the tokens
// were produced from (offsets are resolved against it). Throws ParseError.
File parse_tokens(const TokenStream& ts, const std::string& filename, const std::string& source);

// Lex + parse in one step.
File parse(const std::string& filename, const std::string& source);

} // namespace httpscript
