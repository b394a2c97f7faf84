/*
 * HTTPScript Value Expansion
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Turns Value templates into concrete strings. Each inline script is
 *   resolved in source order and replaces the first remaining occurrence of
 *   its placeholder. The live path asks the ScriptingHost; the static path
 *   (--dry-run) resolves generators natively and never runs a script.
 */
#pragma once
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "httpscript/http/http.hpp"
#include "httpscript/parse/ast.hpp"

namespace httpscript {

class ScriptingHost;

std::string interpolate(const Value& value, const std::function<std::string(const InlineScript&)>& resolve);

// Live resolution through the scripting host.
std::string process(ScriptingHost& host, const Value& value);
// Same as process(), then every whitespace character is removed.
std::string process_target(ScriptingHost& host, const Value& value);

std::string strip_whitespace(const std::string& s);
// Replaces the first occurrence of `from`; returns false when absent.
bool replace_first(std::string& text, const std::string& from, const std::string& to);

struct GeneratorCall {
    std::string name;                     // "$random.integer", "$uuid", ...
    std::optional<std::vector<double>> args; // nullopt when written without parentheses
};

// Textual parse of a "$..." fragment. Unknown generators and malformed
// argument lists yield nullopt.
std::optional<GeneratorCall> parse_generator_call(const std::string& fragment);

// Produces the value of a parsed call; nullopt for out-of-range arguments.
std::optional<std::string> generate(const GeneratorCall& call);

// Resolver for contexts where no script may run.
class StaticResolver {
public:
    StaticResolver(nlohmann::json environment, nlohmann::json snapshot);

    std::string resolve(const InlineScript& script) const;
    std::string process(const Value& value) const;
    // Declares the section variables, then resolves target/headers/body.
    http::Request resolve_request(const RequestScript& script);

private:
    nlohmann::json m_environment;
    nlohmann::json m_snapshot;
    nlohmann::json m_request = nlohmann::json::object();
};

} // namespace httpscript
