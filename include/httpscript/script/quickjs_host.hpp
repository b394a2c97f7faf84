/*
 * HTTPScript QuickJS Scripting Host
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   ScriptingHost backed by the QuickJS C API. One JSRuntime/JSContext pair
 *   lives for a single request; reset() tears it down and builds a fresh one,
 *   so nothing a handler leaves on the global object survives. Variable
 *   stores are plain nlohmann::json objects owned by the host and reached
 *   from JavaScript through native functions only:
 *
 *     client.log / client.test / client.assert / client.global
 *     request.*   (pre-request handlers)
 *     response.*  (response handlers)
 *     $uuid, $timestamp, $isoTimestamp, $random.*
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
#include "httpscript/script/host.hpp"

struct JSRuntime;
struct JSContext;

namespace httpscript {

class QuickJsHost : public ScriptingHost {
public:
    // Throws ScriptError when the environment defines `client`, ConfigError
    // when either store is not a JSON object.
    QuickJsHost(nlohmann::json environment, nlohmann::json snapshot);
    ~QuickJsHost() override;

    QuickJsHost(const QuickJsHost&) = delete;
    QuickJsHost& operator=(const QuickJsHost&) = delete;

    std::string execute(const std::string& source, const Selection& selection = Selection::none()) override;
    std::string resolve(const std::string& fragment) override;
    void define_variable(const std::string& name, const std::string& value) override;
    void pre_handle(const Handler& handler, const Request& request) override;
    void handle(const Handler& handler, const http::Response& response) override;
    TestsReport report() const override { return m_tests; }
    void reset() override;
    nlohmann::json snapshot() const override { return m_state.persisted; }

    // Native bindings
    HostState& state() { return m_state; }
    TestsReport& tests() { return m_tests; }
    const Request* current_request() const { return m_request; }

private:
    void build_context();
    void destroy_context();
    void run_pending_jobs();

    HostState m_state;
    TestsReport m_tests;
    const Request* m_request = nullptr;
    JSRuntime* m_rt = nullptr;
    JSContext* m_ctx = nullptr;
};

} // namespace httpscript
