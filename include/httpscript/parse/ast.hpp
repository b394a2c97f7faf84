/*
 * HTTPScript AST Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Immutable tree produced by the parser for one .http file: a list of
 *   request scripts, each with optional name, variable declarations,
 *   pre-request handler, request (method, target, headers, body) and
 *   response handler. Text fields are kept as Value templates that may
 *   carry {{ ... }} inline scripts.
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
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "httpscript/http/method.hpp"
#include "httpscript/parse/selection.hpp"

namespace httpscript {

// One {{ ... }} occurrence inside a value.
struct InlineScript {
    std::string script;      // trimmed inner text
    std::string placeholder; // exact source text, braces included
    Selection selection;
};

struct Value {
    struct WithInline {
        std::string value;
        std::vector<InlineScript> inline_scripts; // source order
        Selection selection;
    };
    struct WithoutInline {
        std::string value;
        Selection selection;
    };

    std::variant<WithInline, WithoutInline> state = WithoutInline{};

    static Value literal(std::string text, Selection selection = Selection::none());

    const std::string& text() const;
    const Selection& selection() const;
    bool has_inline() const { return std::holds_alternative<WithInline>(state); }
    const std::vector<InlineScript>& inline_scripts() const;
};

struct Header {
    std::string field_name;
    Value field_value;
    Selection selection;
};

struct Request {
    http::Method method = http::Method::Get;
    Selection method_selection;
    Value target; // raw, may span several indented lines
    std::optional<std::string> http_version;
    std::vector<Header> headers;
    std::optional<Value> body;
    Selection selection;
};

struct Handler {
    std::string script;
    Selection selection;
};

struct RequestVariable {
    std::string name;
    Value value;
    Selection selection;
};

struct RequestScript {
    std::optional<std::string> name;
    std::vector<RequestVariable> request_variables;
    std::optional<Handler> pre_request_handler;
    Request request;
    std::optional<Handler> handler;
    Selection selection;
};

struct File {
    std::vector<RequestScript> request_scripts;
};

} // namespace httpscript
