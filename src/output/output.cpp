/*
 * HTTPScript Output Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <algorithm>
#include <nlohmann/json.hpp>
#include <httpscript/error.hpp>
#include <httpscript/output/output.hpp>

namespace httpscript {

std::vector<FormatItem> parse_format(const std::string& format) {
    std::vector<FormatItem> items;
    std::string chars;
    auto flush = [&] {
        if (!chars.empty()) items.push_back({FormatItem::Kind::Chars, chars});
        chars.clear();
    };
    for (std::size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%') { chars.push_back(format[i]); continue; }
        if (i + 1 >= format.size()) throw ConfigError("invalid format: trailing '%'");
        char c = format[++i];
        if (c == '%') { chars.push_back('%'); continue; }
        FormatItem::Kind kind;
        switch (c) {
            case 'R': kind = FormatItem::Kind::FirstLine; break;
            case 'H': kind = FormatItem::Kind::Headers; break;
            case 'B': kind = FormatItem::Kind::Body; break;
            case 'T': kind = FormatItem::Kind::Tests; break;
            case 'N': kind = FormatItem::Kind::Name; break;
            default: throw ConfigError(std::string("invalid format item '%") + c + "'");
        }
        flush();
        items.push_back({kind, ""});
    }
    flush();
    return items;
}

std::string prettify_body(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !(j.is_object() || j.is_array())) return body;
    return j.dump(2);
}

static std::string header_lines(const http::Headers& headers) {
    std::string out;
    for (const auto& [name, value] : headers) {
        if (!out.empty()) out += '\n';
        out += name + ": " + value;
    }
    return out;
}

FormattedOutput::FormattedOutput(std::ostream& out, std::ostream& err, const std::string& request_format,
                                 const std::string& response_format, bool color)
    : m_out(out), m_err(err), m_request_format(parse_format(request_format)),
      m_response_format(parse_format(response_format)), m_color(color) {}

std::string FormattedOutput::paint(const std::string& text, const char* code) const {
    if (!m_color) return text;
    return std::string("\x1b[") + code + "m" + text + "\x1b[0m";
}

std::string FormattedOutput::test_lines(const TestsReport& tests) const {
    std::string out;
    for (const auto& [name, result] : tests.tests()) {
        if (!out.empty()) out += '\n';
        if (auto e = std::get_if<TestError>(&result)) out += "Test `" + name + "`: " + paint("FAILED", "31") + " with " + e->message;
        else out += "Test `" + name + "`: " + paint("OK", "32");
    }
    return out;
}

void FormattedOutput::request(const http::Request& request, const std::string& name) {
    m_name = name;
    for (const auto& item : m_request_format) {
        switch (item.kind) {
            case FormatItem::Kind::FirstLine: m_out << to_string(request.method) << ' ' << request.target; break;
            case FormatItem::Kind::Headers: m_out << header_lines(request.headers); break;
            case FormatItem::Kind::Body: if (request.body) m_out << prettify_body(*request.body); break;
            case FormatItem::Kind::Tests: break;
            case FormatItem::Kind::Name: m_out << name; break;
            case FormatItem::Kind::Chars: m_out << item.text; break;
        }
    }
    m_out.flush();
}

void FormattedOutput::response(const http::Response& response, const TestsReport& tests) {
    for (const auto& item : m_response_format) {
        switch (item.kind) {
            case FormatItem::Kind::FirstLine: m_out << response.status_line(); break;
            case FormatItem::Kind::Headers: m_out << header_lines(response.headers); break;
            case FormatItem::Kind::Body: if (response.body) m_out << prettify_body(*response.body); break;
            case FormatItem::Kind::Tests: m_out << test_lines(tests); break;
            case FormatItem::Kind::Name: m_out << m_name; break;
            case FormatItem::Kind::Chars: m_out << item.text; break;
        }
    }
    m_out.flush();
}

void FormattedOutput::tests(const std::vector<RequestReport>& reports) {
    std::vector<std::string> failures;
    for (const auto& r : reports)
        for (const auto& [test, message] : r.tests.failed())
            failures.push_back("Test `" + test + "` in `[" + r.display_name() + "]` FAILED with " + message);
    if (failures.empty()) return;
    m_err << paint("RUN FAILED", "31") << '\n';
    for (std::size_t i = 0; i < failures.size(); ++i) m_err << (i + 1) << ". " << failures[i] << '\n';
    m_err.flush();
}

void CiOutput::tests(const std::vector<RequestReport>& reports) {
    std::vector<std::vector<std::string>> rows;
    std::size_t failed = 0;
    for (const auto& r : reports) {
        if (r.tests.empty()) rows.push_back({r.source, r.request, "NO TESTS FOUND", ""});
        for (const auto& [test, result] : r.tests.tests()) {
            auto e = std::get_if<TestError>(&result);
            rows.push_back({r.source, r.request, test, e ? "FAILED: " + e->message : "OK"});
        }
        if (!r.tests.failed().empty()) ++failed;
    }

    const std::vector<std::string> head = {"File", "Request", "Test", "Result"};
    std::vector<std::size_t> width(head.size());
    for (std::size_t c = 0; c < head.size(); ++c) {
        width[c] = head[c].size();
        for (const auto& row : rows) width[c] = std::max(width[c], row[c].size());
    }
    auto rule = [&] {
        m_out << '+';
        for (auto w : width) m_out << std::string(w + 2, '-') << '+';
        m_out << '\n';
    };
    auto line = [&](const std::vector<std::string>& cells) {
        m_out << '|';
        for (std::size_t c = 0; c < cells.size(); ++c) m_out << ' ' << cells[c] << std::string(width[c] - cells[c].size(), ' ') << " |";
        m_out << '\n';
    };

    rule();
    line(head);
    rule();
    for (const auto& row : rows) line(row);
    rule();
    m_out << reports.size() << " requests completed, " << failed << " have failed tests" << '\n';
    m_out.flush();
}

} // namespace httpscript
