/*
 * HTTPScript Lexer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Classifies every line of a .http file. See header for details.
 */
#include <cctype>
#include <httpscript/lex/lexer.hpp>

namespace httpscript {

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string ltrim(const std::string& s) {
    std::size_t b = 0;
    while (b < s.size() && is_space(s[b])) ++b;
    return s.substr(b);
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

bool is_blank(const std::string& s) {
    for (char c : s) if (!is_space(c)) return false;
    return true;
}

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

bool Lexer::eof() const { return m_pos >= m_input.size(); }

std::size_t Lexer::line_end() const {
    auto nl = m_input.find('\n', m_pos);
    return nl == std::string::npos ? m_input.size() : nl;
}

TokenStream Lexer::run() {
    TokenStream ts;
    while (!eof()) {
        ts.push_back(next());
        if (ts.back().kind == TokenKind::Invalid) break;
    }
    ts.push_back({TokenKind::Eof, "", m_input.size(), m_input.size()});
    return ts;
}

Token Lexer::next() {
    std::size_t start = m_pos;
    std::size_t eol = line_end();
    std::size_t end = eol;
    if (end > start && m_input[end - 1] == '\r') --end; // CRLF
    std::string line = m_input.substr(start, end - start);
    std::string body = ltrim(line);
    std::size_t indent = line.size() - body.size();

    if (body.empty()) { m_pos = eol + 1; return {TokenKind::Blank, line, start, end}; }

    if ((body[0] == '<' || body[0] == '>')) {
        std::size_t i = 1;
        while (i < body.size() && (body[i] == ' ' || body[i] == '\t')) ++i;
        if (body.compare(i, 2, "{%") == 0) {
            TokenKind kind = body[0] == '<' ? TokenKind::PreHandler : TokenKind::ResponseHandler;
            return lex_handler(kind, start + indent, start + indent + i);
        }
    }

    m_pos = eol + 1;
    if (body.compare(0, 3, "###") == 0) return {TokenKind::Separator, line, start, end};
    if (body[0] == '#') return {TokenKind::Comment, line, start, end};
    if (body[0] == '@') return {TokenKind::Declaration, line, start, end};
    return {TokenKind::Text, line, start, end};
}

// start: first char of the "<"/">" marker, open: offset of "{%"
Token Lexer::lex_handler(TokenKind kind, std::size_t start, std::size_t open) {
    std::size_t close = m_input.find("%}", open + 2);
    if (close == std::string::npos) {
        m_pos = m_input.size();
        return {TokenKind::Invalid, "unterminated handler block, expected '%}'", start, m_input.size()};
    }
    std::size_t end = close + 2;
    m_pos = end;
    std::size_t eol = line_end();
    std::string rest = m_input.substr(end, eol - end);
    if (!is_blank(rest)) {
        m_pos = m_input.size();
        return {TokenKind::Invalid, "unexpected text after handler block", end, eol};
    }
    m_pos = eol + 1;
    return {kind, trim(m_input.substr(open + 2, close - open - 2)), start, end};
}

} // namespace httpscript
