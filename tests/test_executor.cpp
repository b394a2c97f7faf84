/*
 * Executor tests - HTTPScript
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <httpscript/exec/executor.hpp>
#include <httpscript/parse/parser.hpp>
#include <httpscript/script/quickjs_host.hpp>
#include "test_support.hpp"

using namespace httpscript;
using httpscript::testing::FakeHttpClient;
using httpscript::testing::RecordingOutput;

namespace {

struct Fixture {
    explicit Fixture(const std::string& src, nlohmann::json env = nlohmann::json::object())
        : file(parse("api.http", src)), host(std::move(env), nlohmann::json::object()) {}

    ExecutionResult run(std::size_t index = 0) {
        SourceItem item{"api.http", index, &file.request_scripts.at(index)};
        Executor ex(item);
        return ex.execute(client, host, output);
    }

    File file;
    QuickJsHost host;
    FakeHttpClient client;
    RecordingOutput output;
};

} // namespace

TEST(ExecutorNames, DisplayName) {
    Fixture f("GET http://x\n\n### login\nPOST http://y\n");
    EXPECT_EQ(f.run(0).name, "api.http / #1");
    EXPECT_EQ(f.run(1).name, "api.http / login");
}

TEST(ExecutorPhases, DeclarationsSeeEarlierOnes) {
    Fixture f("@base = http://a.com\n@url = {{base}}/x\nGET {{url}}\n");
    f.run();
    ASSERT_EQ(f.client.requests.size(), 1u);
    EXPECT_EQ(f.client.requests[0].target, "http://a.com/x");
}

TEST(ExecutorPhases, PreRequestHandlerFeedsHeaders) {
    Fixture f("< {% client.global.set('token', 'abc') %}\nGET http://x\nAuthorization: {{token}}\n");
    f.run();
    ASSERT_EQ(f.client.requests.size(), 1u);
    ASSERT_EQ(f.client.requests[0].headers.size(), 1u);
    EXPECT_EQ(f.client.requests[0].headers[0], std::make_pair(std::string("Authorization"), std::string("abc")));
}

TEST(ExecutorPhases, ResolvedRequestShape) {
    Fixture f("POST http://{{host}}/items\nContent-Type: application/json\n\n{\"name\": \"{{name}}\"}", {{"host", "h"}, {"name", "n"}});
    f.run();
    const auto& req = f.client.requests.at(0);
    EXPECT_EQ(req.method, http::Method::Post);
    EXPECT_EQ(req.target, "http://h/items");
    ASSERT_TRUE(req.body);
    EXPECT_EQ(*req.body, "{\"name\": \"n\"}");
}

TEST(ExecutorReport, NoHandlerMeansEmptyReport) {
    Fixture f("GET http://x\n");
    auto result = f.run();
    EXPECT_TRUE(result.report.empty());
}

TEST(ExecutorReport, HandlerTestsAreReported) {
    Fixture f("GET http://x\n\n> {% client.test('status', () => client.assert(response.status === 200)) %}\n");
    f.client.responses.push_back(FakeHttpClient::ok(std::nullopt, 500));
    auto result = f.run();
    ASSERT_EQ(result.report.size(), 1u);
    EXPECT_EQ(result.report.failed().count("status"), 1u);
}

TEST(ExecutorOutput, RequestBeforeResponse) {
    Fixture f("GET http://x\n");
    f.run();
    ASSERT_EQ(f.output.events.size(), 2u);
    EXPECT_EQ(f.output.events[0], "request api.http / #1");
    EXPECT_EQ(f.output.events[1], "response 200");
    EXPECT_EQ(f.output.requests[0].target, "http://x");
}

TEST(ExecutorErrors, TransportErrorCarriesRequestName) {
    Fixture f("GET http://x\n");
    f.client.fail_with = "connection refused";
    try {
        f.run();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("api.http / #1"), std::string::npos);
        EXPECT_NE(msg.find("connection refused"), std::string::npos);
    }
    ASSERT_EQ(f.output.events.size(), 1u);
}

TEST(ExecutorErrors, ScriptErrorOutsideTest) {
    Fixture f("GET http://x\n\n> {% undefinedFunction() %}\n");
    try {
        f.run();
        FAIL() << "expected ScriptError";
    } catch (const ScriptError& e) {
        EXPECT_NE(std::string(e.what()).find("Error handling response for api.http / #1"), std::string::npos);
        ASSERT_TRUE(e.selection());
        EXPECT_EQ(e.selection()->start.line, 3u);
    }
}

TEST(ExecutorErrors, PreRequestErrorStopsBeforeSend) {
    Fixture f("< {% throw new Error('nope') %}\nGET http://x\n");
    EXPECT_THROW(f.run(), ScriptError);
    EXPECT_TRUE(f.client.requests.empty());
}
