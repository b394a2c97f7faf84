/*
 * HTTPScript Value Expansion Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 * Description: Placeholder substitution and static generator parsing.
 */
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <httpscript/expand/expand.hpp>
#include <httpscript/lex/lexer.hpp>
#include <httpscript/script/generators.hpp>
#include <httpscript/script/host.hpp>

namespace httpscript {

std::string interpolate(const Value& value, const std::function<std::string(const InlineScript&)>& resolve) {
    std::string out = value.text();
    for (const auto& script : value.inline_scripts()) replace_first(out, script.placeholder, resolve(script));
    return out;
}

std::string process(ScriptingHost& host, const Value& value) {
    if (!value.has_inline()) return value.text();
    return interpolate(value, [&](const InlineScript& s) { return host.resolve(s.script); });
}

std::string process_target(ScriptingHost& host, const Value& value) { return strip_whitespace(process(host, value)); }

std::string strip_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
    return out;
}

bool replace_first(std::string& text, const std::string& from, const std::string& to) {
    auto pos = text.find(from);
    if (pos == std::string::npos) return false;
    text.replace(pos, from.size(), to);
    return true;
}

namespace {

struct GeneratorSignature {
    const char* name;
    int min_args;
    int max_args;
    bool callable;  // may be written with parentheses
    bool bare;      // may be written without parentheses
    bool integral;  // arguments must be integers
};

const GeneratorSignature kGenerators[] = {
    {"$uuid", 0, 0, false, true, false},
    {"$timestamp", 0, 0, false, true, false},
    {"$isoTimestamp", 0, 0, false, true, false},
    {"$random.uuid", 0, 0, false, true, false},
    {"$random.email", 0, 0, false, true, false},
    {"$random.integer", 0, 2, true, true, true},
    {"$random.float", 0, 2, true, true, false},
    {"$random.alphabetic", 1, 1, true, false, true},
    {"$random.alphanumeric", 1, 1, true, false, true},
    {"$random.hexadecimal", 1, 1, true, false, true},
};

const GeneratorSignature* find_generator(const std::string& name) {
    for (const auto& g : kGenerators) if (name == g.name) return &g;
    return nullptr;
}

std::optional<double> parse_number(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    char* end = nullptr;
    double d = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || !std::isfinite(d)) return std::nullopt;
    return d;
}

} // namespace

std::optional<GeneratorCall> parse_generator_call(const std::string& fragment) {
    std::string text = trim(fragment);
    if (text.empty() || text[0] != '$') return std::nullopt;

    auto open = text.find('(');
    GeneratorCall call;
    call.name = trim(text.substr(0, open));
    const GeneratorSignature* sig = find_generator(call.name);
    if (!sig) return std::nullopt;

    if (open == std::string::npos) {
        if (!sig->bare) return std::nullopt;
        return call;
    }
    if (!sig->callable || text.back() != ')') return std::nullopt;

    std::vector<double> args;
    std::string inner = text.substr(open + 1, text.size() - open - 2);
    if (!trim(inner).empty()) {
        std::size_t start = 0;
        while (true) {
            auto comma = inner.find(',', start);
            auto n = parse_number(inner.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
            if (!n) return std::nullopt;
            if (sig->integral && (std::floor(*n) != *n || !generators::fits_integer(*n))) return std::nullopt;
            args.push_back(*n);
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
    }
    if (static_cast<int>(args.size()) < sig->min_args || static_cast<int>(args.size()) > sig->max_args)
        return std::nullopt;
    call.args = std::move(args);
    return call;
}

std::optional<std::string> generate(const GeneratorCall& call) {
    namespace g = generators;
    const std::vector<double> none;
    const auto& a = call.args ? *call.args : none;
    try {
        if (call.name == "$uuid" || call.name == "$random.uuid") return g::uuid();
        if (call.name == "$random.email") return g::email();
        if (call.name == "$timestamp") return std::to_string(g::timestamp());
        if (call.name == "$isoTimestamp") return g::iso_timestamp();
        if (call.name == "$random.integer") {
            auto i = [&](std::size_t k) { return static_cast<std::int64_t>(a[k]); };
            if (a.empty()) return std::to_string(g::integer());
            if (a.size() == 1) return std::to_string(g::integer(i(0)));
            return std::to_string(g::integer(i(0), i(1)));
        }
        if (call.name == "$random.float") {
            if (a.empty()) return g::format_number(g::real());
            if (a.size() == 1) return g::format_number(g::real(a[0]));
            return g::format_number(g::real(a[0], a[1]));
        }
        if (a.size() != 1 || a[0] < 0) return std::nullopt;
        auto length = static_cast<std::size_t>(a[0]);
        if (call.name == "$random.alphabetic") return g::alphabetic(length);
        if (call.name == "$random.alphanumeric") return g::alphanumeric(length);
        if (call.name == "$random.hexadecimal") return g::hexadecimal(length);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::length_error&) {
        return std::nullopt;
    }
    return std::nullopt;
}

StaticResolver::StaticResolver(nlohmann::json environment, nlohmann::json snapshot)
    : m_environment(std::move(environment)), m_snapshot(std::move(snapshot)) {}

std::string StaticResolver::resolve(const InlineScript& script) const {
    const std::string& name = script.script;
    if (!name.empty() && name[0] == '$') {
        auto call = parse_generator_call(name);
        if (!call) return script.placeholder;
        auto value = generate(*call);
        return value ? *value : script.placeholder;
    }
    for (const auto* store : {&m_request, &m_snapshot, &m_environment}) {
        auto it = store->find(name);
        if (it != store->end() && !it->is_null()) return render_value(*it);
    }
    return "{{" + name + "}}";
}

std::string StaticResolver::process(const Value& value) const {
    return interpolate(value, [this](const InlineScript& s) { return resolve(s); });
}

http::Request StaticResolver::resolve_request(const RequestScript& script) {
    m_request = nlohmann::json::object();
    for (const auto& var : script.request_variables) m_request[var.name] = process(var.value);

    http::Request req;
    req.method = script.request.method;
    req.target = strip_whitespace(process(script.request.target));
    for (const auto& h : script.request.headers) req.headers.emplace_back(h.field_name, process(h.field_value));
    if (script.request.body) req.body = process(*script.request.body);
    return req;
}

} // namespace httpscript
