/*
 * HTTPScript Runtime
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <httpscript/error.hpp>
#include <httpscript/exec/executor.hpp>
#include <httpscript/exec/runtime.hpp>
#include <httpscript/expand/expand.hpp>
#include <httpscript/log.hpp>
#include <httpscript/script/quickjs_host.hpp>

namespace httpscript {

Runtime::Runtime(EnvironmentProvider& environment, Output& output, std::unique_ptr<http::HttpClient> client)
    : Runtime(environment, output, std::move(client),
              std::make_unique<QuickJsHost>(environment.environment(), environment.snapshot())) {}

Runtime::Runtime(EnvironmentProvider& environment, Output& output, std::unique_ptr<http::HttpClient> client,
                 std::unique_ptr<ScriptingHost> host)
    : m_environment(environment), m_output(output), m_client(std::move(client)), m_host(std::move(host)) {}

void Runtime::execute(const SourceProvider& sources) {
    std::vector<TestFailure> failures;
    std::vector<RequestReport> reports;
    for (const auto& item : sources.requests()) {
        Executor executor(item);
        auto result = executor.execute(*m_client, *m_host, m_output);
        for (const auto& [test, message] : result.report.failed()) failures.push_back({result.name, test, message});
        reports.push_back({item.name, item.label(), std::move(result.report)});
        m_host->reset();
    }
    m_environment.save(m_host->snapshot());
    m_output.tests(reports);
    debug_log(std::to_string(reports.size()) + " requests completed, " + std::to_string(failures.size()) + " failed tests");
    if (!failures.empty()) throw TestFailuresError(std::move(failures));
}

void dry_run(const SourceProvider& sources, const EnvironmentProvider& environment, Output& output) {
    StaticResolver resolver(environment.environment(), environment.snapshot());
    for (const auto& item : sources.requests()) output.request(resolver.resolve_request(*item.script), item.display_name());
}

} // namespace httpscript
