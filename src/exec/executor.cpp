/*
 * HTTPScript Executor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <httpscript/error.hpp>
#include <httpscript/exec/executor.hpp>
#include <httpscript/expand/expand.hpp>
#include <httpscript/log.hpp>

namespace httpscript {

void Executor::declare_variables(ScriptingHost& host) {
    for (const auto& var : m_source.script->request_variables) {
        std::string value = process(host, var.value);
        debug_log(m_name + ": @" + var.name + " = " + value);
        host.define_variable(var.name, value);
    }
}

void Executor::pre_request(ScriptingHost& host) {
    const auto& script = *m_source.script;
    if (!script.pre_request_handler) return;
    debug_log(m_name + ": pre-request handler");
    host.pre_handle(*script.pre_request_handler, script.request);
}

http::Request Executor::resolve_request(ScriptingHost& host) {
    const auto& req = m_source.script->request;
    http::Request out;
    out.method = req.method;
    out.target = process_target(host, req.target);
    for (const auto& h : req.headers) out.headers.emplace_back(h.field_name, process(host, h.field_value));
    if (req.body) out.body = process(host, *req.body);
    return out;
}

TestsReport Executor::handle_response(ScriptingHost& host, const http::Response& response) {
    const auto& script = *m_source.script;
    if (!script.handler) return TestsReport{};
    debug_log(m_name + ": response handler");
    host.handle(*script.handler, response);
    return host.report();
}

ExecutionResult Executor::execute(http::HttpClient& client, ScriptingHost& host, Output& output) {
    try {
        declare_variables(host);
    } catch (const ScriptError& e) {
        throw ScriptError("Error declaring variables for " + m_name + ": " + e.what(), e.selection());
    }
    try {
        pre_request(host);
    } catch (const ScriptError& e) {
        throw ScriptError("Error pre handling request " + m_name + ": " + e.what(), e.selection());
    }

    http::Request request;
    try {
        request = resolve_request(host);
    } catch (const ScriptError& e) {
        throw ScriptError("Error resolving request " + m_name + ": " + e.what(), e.selection());
    }
    output.request(request, m_name);

    debug_log(m_name + ": " + to_string(request.method) + " " + request.target);
    http::Response response;
    try {
        response = client.execute(request);
    } catch (const TransportError& e) {
        throw TransportError("Error executing request " + m_name + ": " + e.what());
    }
    debug_log(m_name + ": " + response.status_line());

    TestsReport report;
    try {
        report = handle_response(host, response);
    } catch (const ScriptError& e) {
        throw ScriptError("Error handling response for " + m_name + ": " + e.what(), e.selection());
    }
    output.response(response, report);
    return {m_name, std::move(report)};
}

} // namespace httpscript
