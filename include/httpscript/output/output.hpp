/*
 * HTTPScript Output
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Presentation of requests, responses and test results. Two flavours:
 *   FormattedOutput (interactive, driven by %-format strings) and CiOutput
 *   (quiet, final summary table).
 *
 *   Format items:
 *     %R  first line (request line / status line)
 *     %H  headers, one per line
 *     %B  body (JSON objects pretty-printed)
 *     %T  test results (responses only)
 *     %N  request display name
 *     %%  literal '%'
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
#include <ostream>
#include <string>
#include <vector>
#include "httpscript/http/http.hpp"
#include "httpscript/script/report.hpp"

namespace httpscript {

struct FormatItem {
    enum class Kind { FirstLine, Headers, Body, Tests, Name, Chars } kind;
    std::string text; // Chars only
};

// Throws ConfigError on an unknown %x item or a dangling '%'.
std::vector<FormatItem> parse_format(const std::string& format);

// Pretty-prints JSON objects and arrays, returns anything else unchanged.
std::string prettify_body(const std::string& body);

struct RequestReport {
    std::string source;  // file name
    std::string request; // declared name or "#N"
    TestsReport tests;

    std::string display_name() const { return source + " / " + request; }
};

class Output {
public:
    virtual ~Output() = default;
    virtual void request(const http::Request& request, const std::string& name) = 0;
    virtual void response(const http::Response& response, const TestsReport& tests) = 0;
    // Called once at the end of a completed run.
    virtual void tests(const std::vector<RequestReport>& reports) = 0;
};

class FormattedOutput : public Output {
public:
    FormattedOutput(std::ostream& out, std::ostream& err, const std::string& request_format,
                    const std::string& response_format, bool color = false);

    void request(const http::Request& request, const std::string& name) override;
    void response(const http::Response& response, const TestsReport& tests) override;
    void tests(const std::vector<RequestReport>& reports) override;

private:
    std::string test_lines(const TestsReport& tests) const;
    std::string paint(const std::string& text, const char* code) const;

    std::ostream& m_out;
    std::ostream& m_err;
    std::vector<FormatItem> m_request_format;
    std::vector<FormatItem> m_response_format;
    bool m_color;
    std::string m_name;
};

class CiOutput : public Output {
public:
    explicit CiOutput(std::ostream& out) : m_out(out) {}

    void request(const http::Request&, const std::string&) override {}
    void response(const http::Response&, const TestsReport&) override {}
    void tests(const std::vector<RequestReport>& reports) override;

private:
    std::ostream& m_out;
};

} // namespace httpscript
