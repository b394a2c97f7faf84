/*
 * HTTPScript Runtime
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Whole-run orchestration. Requests run strictly one after the other
 *   against a single scripting host, which is reset between requests so
 *   that only the persisted store carries over. At the end the snapshot is
 *   saved once and failing tests are raised together as TestFailuresError.
 *   Fatal errors (parse, transport, script) propagate at once and skip the
 *   save.
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
#include <memory>
#include "httpscript/env/environment.hpp"
#include "httpscript/exec/source.hpp"
#include "httpscript/http/http.hpp"
#include "httpscript/output/output.hpp"
#include "httpscript/script/host.hpp"

namespace httpscript {

class Runtime {
public:
    // Builds a QuickJsHost from the provider's environment and snapshot.
    Runtime(EnvironmentProvider& environment, Output& output, std::unique_ptr<http::HttpClient> client);
    Runtime(EnvironmentProvider& environment, Output& output, std::unique_ptr<http::HttpClient> client,
            std::unique_ptr<ScriptingHost> host);

    // Throws TestFailuresError when tests failed, other Error kinds on fatal failures.
    void execute(const SourceProvider& sources);

private:
    EnvironmentProvider& m_environment;
    Output& m_output;
    std::unique_ptr<http::HttpClient> m_client;
    std::unique_ptr<ScriptingHost> m_host;
};

// --dry-run: resolves every request statically and hands it to output.request().
// Nothing is sent, no script runs and no snapshot is written.
void dry_run(const SourceProvider& sources, const EnvironmentProvider& environment, Output& output);

} // namespace httpscript
