/*
 * HTTPScript Parser Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <algorithm>
#include <cctype>
#include <httpscript/error.hpp>
#include <httpscript/lex/lexer.hpp>
#include <httpscript/parse/parser.hpp>

namespace httpscript {

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// RFC 7230 tchar
bool is_token_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    return std::string("!#$%&'*+-.^_`|~").find(c) != std::string::npos;
}

// Offset -> line/col table for one source text.
class SourceMap {
public:
    SourceMap(const std::string& filename, const std::string& source) : m_filename(filename) {
        m_line_starts.push_back(0);
        for (std::size_t i = 0; i < source.size(); ++i)
            if (source[i] == '\n') m_line_starts.push_back(i + 1);
    }

    Position at(std::size_t offset) const {
        auto it = std::upper_bound(m_line_starts.begin(), m_line_starts.end(), offset);
        std::size_t line = static_cast<std::size_t>(it - m_line_starts.begin());
        return {line, offset - m_line_starts[line - 1] + 1};
    }

    Selection select(std::size_t from, std::size_t to) const { return {m_filename, at(from), at(to)}; }

private:
    std::string m_filename;
    std::vector<std::size_t> m_line_starts;
};

class Parser {
public:
    Parser(const TokenStream& ts, const std::string& filename, const std::string& source)
        : m_ts(ts), m_src(source), m_map(filename, source) {}

    File parse_file() {
        File file;
        std::optional<std::string> name;
        std::size_t begin = 0;
        for (std::size_t i = 0; i < m_ts.size(); ++i) {
            const Token& t = m_ts[i];
            if (t.kind == TokenKind::Invalid) throw ParseError(t.lexeme, m_map.select(t.pos, t.end));
            if (t.kind != TokenKind::Separator && t.kind != TokenKind::Eof) continue;
            if (auto script = parse_section(begin, i, name)) file.request_scripts.push_back(std::move(*script));
            if (t.kind == TokenKind::Eof) break;
            std::string label = trim(ltrim(t.lexeme).substr(3));
            name = label.empty() ? std::nullopt : std::optional<std::string>(label);
            begin = i + 1;
        }
        return file;
    }

private:
    const TokenStream& m_ts;
    const std::string& m_src;
    SourceMap m_map;

    static bool trivia(const Token& t) { return t.kind == TokenKind::Blank || t.kind == TokenKind::Comment; }

    [[noreturn]] void fail(const std::string& message, const Token& t) const {
        throw ParseError(message, m_map.select(t.pos, t.end));
    }

    std::optional<RequestScript> parse_section(std::size_t i, std::size_t end, const std::optional<std::string>& name) {
        while (i < end && trivia(m_ts[i])) ++i;
        if (i == end) return std::nullopt;

        RequestScript rs;
        rs.name = name;
        std::size_t first = m_ts[i].pos;

        while (i < end && (m_ts[i].kind == TokenKind::Declaration || trivia(m_ts[i]))) {
            if (m_ts[i].kind == TokenKind::Declaration) rs.request_variables.push_back(parse_declaration(m_ts[i]));
            ++i;
        }
        if (i < end && m_ts[i].kind == TokenKind::PreHandler) {
            rs.pre_request_handler = Handler{m_ts[i].lexeme, m_map.select(m_ts[i].pos, m_ts[i].end)};
            ++i;
            while (i < end && trivia(m_ts[i])) ++i;
        }
        if (i == end) {
            const Token& at = m_ts[end];
            throw ParseError("missing request line", m_map.select(at.pos, at.end));
        }
        if (m_ts[i].kind == TokenKind::Declaration) fail("variable declarations must precede the pre-request handler", m_ts[i]);
        if (m_ts[i].kind != TokenKind::Text) fail("missing request line", m_ts[i]);

        std::size_t request_from = 0;
        i = parse_request_line(i, end, rs.request, request_from);
        std::size_t last = m_ts[i - 1].end;

        // headers
        for (; i < end; ++i) {
            const Token& t = m_ts[i];
            if (t.kind == TokenKind::Comment) continue;
            if (t.kind != TokenKind::Text) break;
            rs.request.headers.push_back(parse_header(t));
            last = t.end;
        }
        if (i < end && (m_ts[i].kind == TokenKind::Declaration || m_ts[i].kind == TokenKind::PreHandler))
            fail("expected header line or blank line", m_ts[i]);

        // body: first to last non-trivia token before the response handler
        while (i < end && m_ts[i].kind == TokenKind::Blank) ++i;
        std::size_t body_first = i, body_last = i;
        for (; i < end && m_ts[i].kind != TokenKind::ResponseHandler; ++i) {
            if (m_ts[i].kind == TokenKind::PreHandler) fail("pre-request handler must precede the request line", m_ts[i]);
            if (!trivia(m_ts[i])) body_last = i + 1;
        }
        while (body_first < body_last && trivia(m_ts[body_first])) ++body_first;
        if (body_first < body_last) {
            std::size_t from = m_ts[body_first].pos, to = m_ts[body_last - 1].end;
            rs.request.body = make_value(from, to);
            last = to;
        }
        rs.request.selection = m_map.select(request_from, last);

        if (i < end) {
            const Token& h = m_ts[i];
            rs.handler = Handler{h.lexeme, m_map.select(h.pos, h.end)};
            last = h.end;
            ++i;
        }
        for (; i < end; ++i)
            if (!trivia(m_ts[i])) fail("unexpected content after response handler", m_ts[i]);

        rs.selection = m_map.select(first, last);
        return rs;
    }

    RequestVariable parse_declaration(const Token& t) {
        const std::string& line = t.lexeme;
        std::size_t at = line.find('@');
        std::size_t eq = line.find('=', at);
        if (eq == std::string::npos) fail("expected '=' in variable declaration", t);
        std::string name = trim(line.substr(at + 1, eq - at - 1));
        if (name.empty() || std::any_of(name.begin(), name.end(), is_space)) fail("invalid variable name", t);
        std::size_t vb = eq + 1, ve = line.size();
        while (vb < ve && is_space(line[vb])) ++vb;
        while (ve > vb && is_space(line[ve - 1])) --ve;
        return {name, make_value(t.pos + vb, t.pos + ve), m_map.select(t.pos, t.end)};
    }

    // Returns the index of the first token after the (possibly multi-line) request line.
    std::size_t parse_request_line(std::size_t i, std::size_t end, Request& req, std::size_t& from) {
        const Token& t = m_ts[i];
        const std::string& line = t.lexeme;
        std::size_t p = 0;
        while (p < line.size() && is_space(line[p])) ++p;
        std::size_t w = p;
        while (w < line.size() && !is_space(line[w])) ++w;
        std::string word = line.substr(p, w - p);
        from = t.pos + p;

        std::size_t target_from = t.pos + p;
        bool has_rest = false;
        for (std::size_t k = w; k < line.size(); ++k) if (!is_space(line[k])) { has_rest = true; break; }
        if (auto m = http::method_from_string(word)) {
            req.method = *m;
            req.method_selection = m_map.select(t.pos + p, t.pos + w);
            std::size_t q = w;
            while (q < line.size() && is_space(line[q])) ++q;
            target_from = t.pos + q;
        } else if (has_rest && std::all_of(word.begin(), word.end(), [](char c) { return c >= 'A' && c <= 'Z'; })) {
            throw ParseError("unsupported method '" + word + "'", m_map.select(t.pos + p, t.pos + w));
        } else {
            req.method = http::Method::Get;
            req.method_selection = m_map.select(t.pos + p, t.pos + p);
        }

        std::size_t target_to = t.end;
        ++i;
        // continuation lines are indented
        while (i < end && m_ts[i].kind == TokenKind::Text && !m_ts[i].lexeme.empty() && is_space(m_ts[i].lexeme[0])) {
            target_to = m_ts[i].end;
            ++i;
        }
        while (target_to > target_from && is_space(m_src[target_to - 1])) --target_to;

        // trailing HTTP/<version>
        std::size_t ws = target_to;
        while (ws > target_from && !is_space(m_src[ws - 1])) --ws;
        if (ws > target_from && m_src.compare(ws, 5, "HTTP/") == 0) {
            req.http_version = m_src.substr(ws, target_to - ws);
            target_to = ws;
            while (target_to > target_from && is_space(m_src[target_to - 1])) --target_to;
        }
        if (target_to <= target_from) fail("missing request target", t);
        req.target = make_value(target_from, target_to);
        return i;
    }

    Header parse_header(const Token& t) {
        const std::string& line = t.lexeme;
        std::size_t colon = line.find(':');
        if (line.empty() || is_space(line[0]) || colon == std::string::npos || colon == 0)
            fail("expected header line or blank line", t);
        std::string name = line.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(), is_token_char)) fail("expected header line or blank line", t);
        std::size_t vb = colon + 1, ve = line.size();
        while (vb < ve && is_space(line[vb])) ++vb;
        while (ve > vb && is_space(line[ve - 1])) --ve;
        return {name, make_value(t.pos + vb, t.pos + ve), m_map.select(t.pos, t.end)};
    }

    Value make_value(std::size_t from, std::size_t to) const {
        std::string text = m_src.substr(from, to - from);
        Selection sel = m_map.select(from, to);
        std::vector<InlineScript> scripts;
        std::size_t pos = 0;
        while (true) {
            std::size_t open = text.find("{{", pos);
            if (open == std::string::npos) break;
            std::size_t close = text.find("}}", open + 2);
            if (close == std::string::npos) break;
            std::string inner = trim(text.substr(open + 2, close - open - 2));
            if (!inner.empty())
                scripts.push_back({inner, text.substr(open, close + 2 - open), m_map.select(from + open, from + close + 2)});
            pos = close + 2;
        }
        if (scripts.empty()) return Value{Value::WithoutInline{std::move(text), std::move(sel)}};
        return Value{Value::WithInline{std::move(text), std::move(scripts), std::move(sel)}};
    }
};

} // namespace

File parse_tokens(const TokenStream& ts, const std::string& filename, const std::string& source) {
    Parser p(ts, filename, source);
    return p.parse_file();
}

File parse(const std::string& filename, const std::string& source) {
    Lexer lx(source);
    auto ts = lx.run();
    return parse_tokens(ts, filename, source);
}

} // namespace httpscript
