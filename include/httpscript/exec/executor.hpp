/*
 * HTTPScript Executor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Runs one request script:
 *     declare variables -> pre-request handler -> resolve request ->
 *     send -> response handler -> report
 *   Script and transport errors are rethrown with the request name attached.
 */
#pragma once
#include <string>
#include "httpscript/exec/source.hpp"
#include "httpscript/http/http.hpp"
#include "httpscript/output/output.hpp"
#include "httpscript/script/host.hpp"

namespace httpscript {

struct ExecutionResult {
    std::string name; // display name
    TestsReport report;
};

class Executor {
public:
    explicit Executor(const SourceItem& source) : m_source(source), m_name(source.display_name()) {}

    ExecutionResult execute(http::HttpClient& client, ScriptingHost& host, Output& output);

private:
    void declare_variables(ScriptingHost& host);
    void pre_request(ScriptingHost& host);
    http::Request resolve_request(ScriptingHost& host);
    TestsReport handle_response(ScriptingHost& host, const http::Response& response);

    const SourceItem& m_source;
    std::string m_name;
};

} // namespace httpscript
