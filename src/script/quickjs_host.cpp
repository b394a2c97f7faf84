/*
 * HTTPScript QuickJS Scripting Host Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include "bindings.hpp"
#include <functional>
#include <httpscript/error.hpp>
#include <httpscript/log.hpp>
#include <httpscript/script/quickjs_host.hpp>

namespace httpscript {

namespace {

struct OnExit {
    std::function<void()> fn;
    ~OnExit() { fn(); }
};

std::optional<Selection> known(const Selection& selection) {
    if (selection.start.line == 0) return std::nullopt;
    return selection;
}

} // namespace

std::string render_value(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

QuickJsHost::QuickJsHost(nlohmann::json environment, nlohmann::json snapshot) {
    if (!environment.is_object()) throw ConfigError("environment must be a JSON object");
    if (!snapshot.is_object()) throw ConfigError("snapshot must be a JSON object");
    if (environment.contains("client")) throw ScriptError("Can't register environment value with the name `client`");
    m_state.environment = std::move(environment);
    m_state.persisted = std::move(snapshot);
    build_context();
}

QuickJsHost::~QuickJsHost() { destroy_context(); }

void QuickJsHost::build_context() {
    m_rt = JS_NewRuntime();
    if (!m_rt) throw ScriptError("cannot create JavaScript runtime");
    m_ctx = JS_NewContext(m_rt);
    if (!m_ctx) {
        JS_FreeRuntime(m_rt);
        m_rt = nullptr;
        throw ScriptError("cannot create JavaScript context");
    }
    JS_SetContextOpaque(m_ctx, this);
    bindings::install_globals(m_ctx);
}

void QuickJsHost::destroy_context() {
    if (m_ctx) JS_FreeContext(m_ctx);
    if (m_rt) JS_FreeRuntime(m_rt);
    m_ctx = nullptr;
    m_rt = nullptr;
}

void QuickJsHost::run_pending_jobs() {
    JSContext* job_ctx = nullptr;
    int r;
    while ((r = JS_ExecutePendingJob(m_rt, &job_ctx)) > 0) {}
    if (r < 0) throw ScriptError(bindings::take_exception(job_ctx));
}

std::string QuickJsHost::execute(const std::string& source, const Selection& selection) {
    const std::string filename = selection.filename.empty() ? "<script>" : selection.filename;
    JSValue v = JS_Eval(m_ctx, source.c_str(), source.size(), filename.c_str(), JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(v)) throw ScriptError(bindings::take_exception(m_ctx), known(selection));
    const char* s = JS_ToCString(m_ctx, v);
    JS_FreeValue(m_ctx, v);
    if (!s) throw ScriptError(bindings::take_exception(m_ctx), known(selection));
    std::string out(s);
    JS_FreeCString(m_ctx, s);
    run_pending_jobs();
    return out;
}

std::string QuickJsHost::resolve(const std::string& fragment) {
    if (!fragment.empty() && fragment[0] == '$') return execute(fragment);
    for (const auto* store : {&m_state.request, &m_state.persisted, &m_state.environment}) {
        auto it = store->find(fragment);
        if (it != store->end() && !it->is_null()) return render_value(*it);
    }
    debug_log("unresolved variable '" + fragment + "'");
    return "{{" + fragment + "}}";
}

void QuickJsHost::define_variable(const std::string& name, const std::string& value) { m_state.request[name] = value; }

void QuickJsHost::pre_handle(const Handler& handler, const Request& request) {
    m_request = &request;
    bindings::install_request(m_ctx);
    OnExit cleanup{[this] {
        bindings::remove_global(m_ctx, "request");
        m_request = nullptr;
    }};
    execute(handler.script, handler.selection);
}

void QuickJsHost::handle(const Handler& handler, const http::Response& response) {
    bindings::install_response(m_ctx, response);
    OnExit cleanup{[this] { bindings::remove_global(m_ctx, "response"); }};
    execute(handler.script, handler.selection);
}

void QuickJsHost::reset() {
    destroy_context();
    m_state.request = nlohmann::json::object();
    m_tests = TestsReport{};
    m_request = nullptr;
    build_context();
}

} // namespace httpscript
