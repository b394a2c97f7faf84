/*
 * Scripting host tests - HTTPScript
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <httpscript/error.hpp>
#include <httpscript/parse/parser.hpp>
#include <httpscript/script/quickjs_host.hpp>

using namespace httpscript;

static http::Response response_with(int status, std::optional<std::string> body, http::Headers headers = {}) {
    http::Response r;
    r.status_code = status;
    r.body = std::move(body);
    r.headers = std::move(headers);
    return r;
}

static Handler handler(const std::string& script) { return Handler{script, Selection::none()}; }

TEST(QuickJsHostBasic, ExecuteReturnsCompletionValue) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    EXPECT_EQ(host.execute("1 + 2"), "3");
    EXPECT_EQ(host.execute("'a' + 'b'"), "ab");
    EXPECT_THROW(host.execute("throw new Error('boom')"), ScriptError);
    EXPECT_THROW(host.execute("this is not javascript"), ScriptError);
}

TEST(QuickJsHostBasic, ClientIsReserved) {
    EXPECT_THROW({ QuickJsHost host(nlohmann::json{{"client", 1}}, nlohmann::json::object()); }, ScriptError);
}

TEST(QuickJsHostResolve, StoreOrder) {
    QuickJsHost host(nlohmann::json{{"a", "env"}, {"c", "envc"}}, nlohmann::json{{"a", "snap"}, {"b", "snapb"}});
    EXPECT_EQ(host.resolve("a"), "snap");
    host.define_variable("a", "req");
    EXPECT_EQ(host.resolve("a"), "req");
    EXPECT_EQ(host.resolve("b"), "snapb");
    EXPECT_EQ(host.resolve("c"), "envc");
    EXPECT_EQ(host.resolve("missing"), "{{missing}}");
}

TEST(QuickJsHostResolve, NonStringValuesAsJson) {
    QuickJsHost host(nlohmann::json{{"n", 5}, {"o", {{"x", 1}}}, {"nil", nullptr}}, nlohmann::json::object());
    EXPECT_EQ(host.resolve("n"), "5");
    EXPECT_EQ(host.resolve("o"), "{\"x\":1}");
    EXPECT_EQ(host.resolve("nil"), "{{nil}}");
}

TEST(QuickJsHostResolve, NamesAreNotEvaluated) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    EXPECT_EQ(host.resolve("1 + 1"), "{{1 + 1}}");
}

TEST(QuickJsHostGenerators, DynamicValues) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    auto a = host.resolve("$uuid");
    auto b = host.resolve("$random.uuid");
    EXPECT_EQ(a.size(), 36u);
    EXPECT_NE(a, b);
    EXPECT_EQ(host.resolve("$random.integer(1, 2)"), "1");
    EXPECT_EQ(host.resolve("$random.hexadecimal(8)").size(), 8u);
    EXPECT_NO_THROW(std::stoll(host.resolve("$random.integer")));
    EXPECT_NO_THROW(std::stod(host.resolve("$random.float")));
    EXPECT_NO_THROW(std::stoll(host.resolve("$timestamp")));
    EXPECT_NE(host.resolve("$random.email").find('@'), std::string::npos);
    EXPECT_EQ(host.execute("typeof $random.alphabetic(3)"), "string");
}

TEST(QuickJsHostGenerators, BadArgumentsThrow) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    EXPECT_THROW(host.resolve("$random.integer(5, 5)"), ScriptError);
    EXPECT_THROW(host.resolve("$random.integer(1.5)"), ScriptError);
    EXPECT_THROW(host.resolve("$random.alphabetic(-1)"), ScriptError);
}

TEST(QuickJsHostGenerators, ArgumentsOutOfIntegerRange) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    EXPECT_THROW(host.resolve("$random.integer(1e20)"), ScriptError);
    EXPECT_THROW(host.resolve("$random.integer(-1e20, 5)"), ScriptError);
    EXPECT_THROW(host.resolve("$random.hexadecimal(1e30)"), ScriptError);
    EXPECT_EQ(host.execute("(() => { try { $random.integer(1e20); return false; } catch (e) { return e instanceof RangeError; } })()"),
              "true");
    EXPECT_EQ(host.execute("(() => { try { $random.alphanumeric(1e30); return false; } catch (e) { return e instanceof RangeError; } })()"),
              "true");
}

TEST(QuickJsHostGlobal, SetGetClear) {
    QuickJsHost host(nlohmann::json{{"fromEnv", "e"}}, nlohmann::json::object());
    host.execute("client.global.set('token', 'abc'); client.global.set('obj', {a: [1, 2]});");
    auto snap = host.snapshot();
    EXPECT_EQ(snap["token"], "abc");
    EXPECT_EQ(snap["obj"], nlohmann::json({{"a", {1, 2}}}));
    EXPECT_EQ(host.execute("client.global.get('fromEnv')"), "e");
    EXPECT_EQ(host.execute("String(client.global.get('nothing'))"), "undefined");
    EXPECT_EQ(host.execute("client.global.get('obj').a[1]"), "2");

    host.execute("client.global.set('x', null); client.global.set('y', undefined);");
    EXPECT_FALSE(host.snapshot().contains("x"));
    EXPECT_FALSE(host.snapshot().contains("y"));

    host.execute("client.global.clear('token')");
    EXPECT_FALSE(host.snapshot().contains("token"));
    EXPECT_EQ(host.execute("client.global.isEmpty()"), "false");
    host.execute("client.global.clearAll()");
    EXPECT_EQ(host.execute("client.global.isEmpty()"), "true");
    EXPECT_EQ(host.execute("client.global.get('fromEnv')"), "e");
}

TEST(QuickJsHostReset, OnlyPersistedStoreSurvives) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    host.define_variable("r", "1");
    host.execute("client.global.set('p', '2'); globalThis.leak = 1; client.test('t', () => {});");
    EXPECT_EQ(host.report().size(), 1u);
    host.reset();
    EXPECT_EQ(host.resolve("r"), "{{r}}");
    EXPECT_EQ(host.resolve("p"), "2");
    EXPECT_EQ(host.execute("typeof leak"), "undefined");
    EXPECT_TRUE(host.report().empty());
}

TEST(QuickJsHostTests, FailureDoesNotStopSiblings) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    host.handle(handler("client.test('a', () => { throw new Error('boom'); });\n"
                        "client.test('b', () => {});"),
                response_with(200, std::nullopt));
    auto report = host.report();
    ASSERT_EQ(report.size(), 2u);
    auto failed = report.failed();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_NE(failed["a"].find("boom"), std::string::npos);
    EXPECT_FALSE(is_failure(report.tests().at("b")));
}

TEST(QuickJsHostTests, AssertMessage) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    host.handle(handler("client.test('ok', () => client.assert(response.status === 200, 'expected 200'));\n"
                        "client.test('plain', () => client.assert(false));"),
                response_with(404, std::nullopt));
    auto failed = host.report().failed();
    EXPECT_EQ(failed["ok"], "Assertion failed: expected 200");
    EXPECT_EQ(failed["plain"], "Assertion failed");
}

TEST(QuickJsHostTests, ErrorOutsideTestIsFatal) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    EXPECT_THROW(host.handle(handler("response.nope.deeper"), response_with(200, std::nullopt)), ScriptError);
    EXPECT_THROW(host.handle(handler("client.test(1, () => {})"), response_with(200, std::nullopt)), ScriptError);
}

TEST(QuickJsHostResponse, JsonAndTextBodies) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    host.handle(handler("client.test('id', () => client.assert(response.body.id === 7));\n"
                        "client.test('ct', () => client.assert(response.headers['Content-Type'] === 'application/json'));\n"
                        "client.global.set('status', response.status);"),
                response_with(201, std::string("{\"id\": 7}"), {{"Content-Type", "application/json"}}));
    EXPECT_TRUE(host.report().failed().empty());
    EXPECT_EQ(host.snapshot()["status"], 201);

    host.reset();
    host.handle(handler("client.global.set('body', response.body)"), response_with(200, std::string("[1, 2]")));
    EXPECT_EQ(host.snapshot()["body"], "[1, 2]");
    host.handle(handler("client.global.set('none', String(response.body))"), response_with(204, std::nullopt));
    EXPECT_EQ(host.snapshot()["none"], "null");
}

TEST(QuickJsHostResponse, InvalidUtf8BodyAndHeader) {
    QuickJsHost host(nlohmann::json::object(), nlohmann::json::object());
    EXPECT_NO_THROW(host.handle(handler("client.test('body', () => client.assert(response.body.startsWith('caf')));\n"
                                        "client.test('len', () => client.assert(response.body.length === 4));\n"
                                        "client.test('hdr', () => client.assert(response.headers['X-Name'].startsWith('Jos')));\n"
                                        "client.global.set('body', response.body);"),
                                response_with(200, std::string("caf\xE9"), {{"X-Name", "Jos\xE9"}})));
    EXPECT_TRUE(host.report().failed().empty());
    EXPECT_EQ(host.snapshot()["body"], "caf\xEF\xBF\xBD");
}

TEST(QuickJsHostRequest, PreHandlerSeesUnprocessedRequest) {
    QuickJsHost host(nlohmann::json{{"host", "a.com"}}, nlohmann::json::object());
    auto file = parse("a.http", "POST http://{{host}}/x\nX-Token: {{token}}\n\nbody {{host}}");
    const auto& request = file.request_scripts[0].request;
    host.pre_handle(handler("request.variables.set('token', request.url.tryGetSubstituted());\n"
                            "client.global.set('raw', request.url.getRaw());\n"
                            "client.global.set('hdr', request.headers.findByName('x-token').getRawValue());\n"
                            "client.global.set('hdr2', request.headers.findByName('x-token').tryGetSubstitutedValue());\n"
                            "client.global.set('missing', request.headers.findByName('nope'));\n"
                            "client.global.set('count', request.headers.all().length);\n"
                            "client.global.set('name', request.headers.all()[0].name);\n"
                            "client.global.set('body', request.body.tryGetSubstituted());\n"
                            "client.global.set('envhost', request.environment.get('host'));"),
                    request);
    EXPECT_EQ(host.resolve("token"), "http://a.com/x");
    auto snap = host.snapshot();
    EXPECT_EQ(snap["raw"], "http://{{host}}/x");
    EXPECT_EQ(snap["hdr"], "{{token}}");
    EXPECT_EQ(snap["hdr2"], "http://a.com/x");
    EXPECT_FALSE(snap.contains("missing"));
    EXPECT_EQ(snap["count"], 1);
    EXPECT_EQ(snap["name"], "X-Token");
    EXPECT_EQ(snap["body"], "body a.com");
    EXPECT_EQ(snap["envhost"], "a.com");
    EXPECT_FALSE(snap.contains("token"));
    EXPECT_EQ(host.execute("typeof request"), "undefined");
}
