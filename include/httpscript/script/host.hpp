/*
 * HTTPScript Scripting Host Interface
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Abstract scripting engine used by the executor. The host owns three
 *   variable stores: the read-only environment, the persisted store (the
 *   only state that survives reset() and is saved at the end of a run) and
 *   the per-request store filled by @declarations and request.variables.
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
#include <nlohmann/json.hpp>
#include <string>
#include "httpscript/http/http.hpp"
#include "httpscript/parse/ast.hpp"
#include "httpscript/script/report.hpp"

namespace httpscript {

struct HostState {
    nlohmann::json environment = nlohmann::json::object();
    nlohmann::json persisted = nlohmann::json::object();
    nlohmann::json request = nlohmann::json::object();
};

class ScriptingHost {
public:
    virtual ~ScriptingHost() = default;

    // Evaluates source in the global scope, returns the completion value as text.
    virtual std::string execute(const std::string& source, const Selection& selection = Selection::none()) = 0;
    // "$..." is evaluated; other names are looked up request -> persisted -> environment,
    // unknown names come back as "{{name}}".
    virtual std::string resolve(const std::string& fragment) = 0;
    virtual void define_variable(const std::string& name, const std::string& value) = 0;
    // `request` is the unprocessed request; it is reachable from the script only while it runs.
    virtual void pre_handle(const Handler& handler, const Request& request) = 0;
    virtual void handle(const Handler& handler, const http::Response& response) = 0;
    virtual TestsReport report() const = 0;
    // Drops everything but the persisted store and the environment.
    virtual void reset() = 0;
    virtual nlohmann::json snapshot() const = 0;
};

// Renders a stored value: strings as-is, everything else as compact JSON.
std::string render_value(const nlohmann::json& value);

} // namespace httpscript
