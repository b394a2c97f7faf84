/*
 * Expansion tests - HTTPScript
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <map>
#include <httpscript/expand/expand.hpp>
#include <httpscript/parse/parser.hpp>
#include <httpscript/script/host.hpp>

using namespace httpscript;

namespace {

// Answers each fragment with the next queued value for it.
class ScriptedHost : public ScriptingHost {
public:
    std::string execute(const std::string&, const Selection&) override { return {}; }
    std::string resolve(const std::string& fragment) override {
        ++calls;
        auto& q = answers[fragment];
        if (q.empty()) return "{{" + fragment + "}}";
        auto v = q.front();
        q.erase(q.begin());
        return v;
    }
    void define_variable(const std::string&, const std::string&) override {}
    void pre_handle(const Handler&, const Request&) override {}
    void handle(const Handler&, const http::Response&) override {}
    TestsReport report() const override { return {}; }
    void reset() override {}
    nlohmann::json snapshot() const override { return nlohmann::json::object(); }

    std::map<std::string, std::vector<std::string>> answers;
    int calls = 0;
};

const Value& body_of(const File& file) { return *file.request_scripts.at(0).request.body; }

} // namespace

TEST(ExpandProcess, LiteralIsIdentity) {
    ScriptedHost host;
    EXPECT_EQ(process(host, Value::literal("plain {text}")), "plain {text}");
    EXPECT_EQ(host.calls, 0);
}

TEST(ExpandProcess, FirstRemainingOccurrenceIsReplaced) {
    ScriptedHost host;
    host.answers["a"] = {"1", "2"};
    auto file = parse("a.http", "POST http://x\n\n{{a}}-{{a}}");
    EXPECT_EQ(process(host, body_of(file)), "1-2");
}

TEST(ExpandProcess, ResolvedTextIsStable) {
    ScriptedHost host;
    host.answers["id"] = {"42"};
    host.answers["name"] = {"bob"};
    auto file = parse("a.http", "POST http://x\n\n{\"id\": {{id}}, \"name\": \"{{ name }}\"}");
    auto resolved = process(host, body_of(file));
    EXPECT_EQ(resolved, "{\"id\": 42, \"name\": \"bob\"}");

    auto again = parse("a.http", "POST http://x\n\n" + resolved);
    EXPECT_FALSE(body_of(again).has_inline());
    int before = host.calls;
    EXPECT_EQ(process(host, body_of(again)), resolved);
    EXPECT_EQ(host.calls, before);
}

TEST(ExpandProcess, DifferentSpellingsAreIndependent) {
    ScriptedHost host;
    host.answers["a"] = {"x", "y"};
    auto file = parse("a.http", "POST http://x\n\n{{ a }} {{a}}");
    EXPECT_EQ(process(host, body_of(file)), "x y");
}

TEST(ExpandProcess, UnresolvedPassesThrough) {
    ScriptedHost host;
    auto file = parse("a.http", "POST http://x\n\nhello {{ name }}");
    EXPECT_EQ(process(host, body_of(file)), "hello {{name}}");
}

TEST(ExpandProcess, TargetWhitespaceStripped) {
    ScriptedHost host;
    host.answers["host"] = {"a.com"};
    auto file = parse("a.http", "GET http://{{host}}/get\n    ?x=1\n    &y=2");
    EXPECT_EQ(process_target(host, file.request_scripts[0].request.target), "http://a.com/get?x=1&y=2");
}

TEST(ExpandHelpers, ReplaceFirst) {
    std::string s = "a-a-a";
    EXPECT_TRUE(replace_first(s, "a", "b"));
    EXPECT_EQ(s, "b-a-a");
    EXPECT_FALSE(replace_first(s, "z", "b"));
    EXPECT_EQ(strip_whitespace(" a \t b\n"), "ab");
}

TEST(ExpandGenerators, ParseCalls) {
    auto bare = parse_generator_call("$random.integer");
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare->name, "$random.integer");
    EXPECT_FALSE(bare->args);

    auto one = parse_generator_call("$random.integer(5)");
    ASSERT_TRUE(one && one->args);
    EXPECT_EQ(*one->args, std::vector<double>({5}));

    auto two = parse_generator_call(" $random.float(0.5, 1.5) ");
    ASSERT_TRUE(two && two->args);
    EXPECT_EQ(*two->args, std::vector<double>({0.5, 1.5}));

    auto empty = parse_generator_call("$random.integer()");
    ASSERT_TRUE(empty && empty->args);
    EXPECT_TRUE(empty->args->empty());

    EXPECT_TRUE(parse_generator_call("$random.alphabetic(4)"));
    EXPECT_TRUE(parse_generator_call("$uuid"));
    EXPECT_TRUE(parse_generator_call("$isoTimestamp"));
}

TEST(ExpandGenerators, MalformedCalls) {
    EXPECT_FALSE(parse_generator_call("$random.integer(1.5)"));
    EXPECT_FALSE(parse_generator_call("$random.integer(a)"));
    EXPECT_FALSE(parse_generator_call("$random.integer(1,2,3)"));
    EXPECT_FALSE(parse_generator_call("$random.integer(5"));
    EXPECT_FALSE(parse_generator_call("$random.integer(1,)"));
    EXPECT_FALSE(parse_generator_call("$random.alphabetic"));
    EXPECT_FALSE(parse_generator_call("$uuid()"));
    EXPECT_FALSE(parse_generator_call("$unknown"));
    EXPECT_FALSE(parse_generator_call("host"));
}

TEST(ExpandGenerators, ArgumentsOutOfIntegerRange) {
    EXPECT_FALSE(parse_generator_call("$random.integer(1e20)"));
    EXPECT_FALSE(parse_generator_call("$random.integer(-1e20, 5)"));
    EXPECT_FALSE(parse_generator_call("$random.hexadecimal(1e30)"));
    EXPECT_FALSE(parse_generator_call("$random.alphabetic(9223372036854775808)"));
    EXPECT_TRUE(parse_generator_call("$random.integer(-9007199254740992, 9007199254740992)"));

    StaticResolver resolver(nlohmann::json::object(), nlohmann::json::object());
    auto file = parse("a.http", "POST http://x\n\n{{$random.integer(-1e20, 5)}}");
    EXPECT_EQ(resolver.process(body_of(file)), "{{$random.integer(-1e20, 5)}}");
}

TEST(ExpandGenerators, Generate) {
    EXPECT_EQ(generate(*parse_generator_call("$random.integer(1, 2)")).value_or(""), "1");
    EXPECT_EQ(generate(*parse_generator_call("$random.hexadecimal(6)"))->size(), 6u);
    EXPECT_EQ(generate(*parse_generator_call("$uuid"))->size(), 36u);
    EXPECT_FALSE(generate(*parse_generator_call("$random.integer(5, 5)")));
}

TEST(ExpandStatic, ResolveRequestWithoutScripts) {
    nlohmann::json env = {{"host", "a.com"}, {"port", 8080}};
    nlohmann::json snap = {{"token", "abc"}};
    StaticResolver resolver(env, snap);
    auto file = parse("a.http",
                      "@id = 42\n"
                      "GET http://{{host}}:{{port}}/{{id}}\n"
                      "Authorization: {{token}}\n"
                      "X-Missing: {{nope}}\n"
                      "X-Bad: {{$random.integer(x)}}\n"
                      "\n"
                      "{\"n\": {{$random.integer(3, 4)}}}");
    auto req = resolver.resolve_request(file.request_scripts[0]);
    EXPECT_EQ(req.method, http::Method::Get);
    EXPECT_EQ(req.target, "http://a.com:8080/42");
    ASSERT_EQ(req.headers.size(), 3u);
    EXPECT_EQ(req.headers[0].second, "abc");
    EXPECT_EQ(req.headers[1].second, "{{nope}}");
    EXPECT_EQ(req.headers[2].second, "{{$random.integer(x)}}");
    ASSERT_TRUE(req.body);
    EXPECT_EQ(*req.body, "{\"n\": 3}");
}
