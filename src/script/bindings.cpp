/*
 * HTTPScript QuickJS native bindings
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Object model exposed to handler scripts. Every native
 *              callback is wrapped by guarded() so that no C++ exception
 *              crosses a QuickJS frame.
 */
#include "bindings.hpp"
#include <cctype>
#include <cmath>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>
#include <httpscript/expand/expand.hpp>
#include <httpscript/script/generators.hpp>
#include <httpscript/script/quickjs_host.hpp>

namespace httpscript::bindings {

namespace {

// A JavaScript exception is already pending on the context.
struct PendingException {};

template <typename F>
JSValue guarded(JSContext* ctx, F&& body) {
    try {
        return body();
    } catch (const PendingException&) {
        return JS_EXCEPTION;
    } catch (const std::exception& e) {
        return JS_ThrowInternalError(ctx, "%s", e.what());
    }
}

QuickJsHost& host_of(JSContext* ctx) { return *static_cast<QuickJsHost*>(JS_GetContextOpaque(ctx)); }

std::string to_std_string(JSContext* ctx, JSValueConst v) {
    const char* s = JS_ToCString(ctx, v);
    if (!s) throw PendingException{};
    std::string out(s);
    JS_FreeCString(ctx, s);
    return out;
}

JSValue new_string(JSContext* ctx, const std::string& s) { return JS_NewStringLen(ctx, s.data(), s.size()); }

// Invalid UTF-8 in strings (e.g. a Latin-1 response body) becomes U+FFFD.
JSValue from_json(JSContext* ctx, const nlohmann::json& value) {
    std::string text = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return JS_ParseJSON(ctx, text.c_str(), text.size(), "<json>");
}

// nullopt for undefined/null and for values JSON cannot represent (functions).
std::optional<nlohmann::json> to_json(JSContext* ctx, JSValueConst value) {
    if (JS_IsUndefined(value) || JS_IsNull(value)) return std::nullopt;
    JSValue text = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
    if (JS_IsException(text)) throw PendingException{};
    if (JS_IsUndefined(text)) return std::nullopt;
    std::string s;
    try {
        s = to_std_string(ctx, text);
    } catch (const PendingException&) {
        JS_FreeValue(ctx, text);
        throw;
    }
    JS_FreeValue(ctx, text);
    return nlohmann::json::parse(s);
}

void set_function(JSContext* ctx, JSValueConst obj, const char* name, JSCFunction* fn, int length) {
    JS_SetPropertyStr(ctx, obj, name, JS_NewCFunction(ctx, fn, name, length));
}

void set_function(JSContext* ctx, JSValueConst obj, const char* name, JSCFunctionMagic* fn, int length, int magic) {
    JS_SetPropertyStr(ctx, obj, name, JS_NewCFunctionMagic(ctx, fn, name, length, JS_CFUNC_generic_magic, magic));
}

void define_getter(JSContext* ctx, JSValueConst obj, const char* name, JSValue getter) {
    JSAtom atom = JS_NewAtom(ctx, name);
    JS_DefinePropertyGetSet(ctx, obj, atom, getter, JS_UNDEFINED, JS_PROP_CONFIGURABLE | JS_PROP_ENUMERABLE);
    JS_FreeAtom(ctx, atom);
}

// ---- variables accessor: magic 0 = persisted store (client.global), 1 = per-request store

enum { kPersisted = 0, kRequest = 1 };

nlohmann::json& store_of(JSContext* ctx, int magic) {
    auto& state = host_of(ctx).state();
    return magic == kPersisted ? state.persisted : state.request;
}

std::optional<std::string> name_arg(JSContext* ctx, int argc, JSValueConst* argv) {
    if (argc < 1 || !JS_IsString(argv[0])) return std::nullopt;
    return to_std_string(ctx, argv[0]);
}

JSValue lookup(JSContext* ctx, const nlohmann::json& store, const std::string& name) {
    auto it = store.find(name);
    if (it == store.end() || it->is_null()) return JS_UNDEFINED;
    return from_json(ctx, *it);
}

JSValue vars_get(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    return guarded(ctx, [&]() -> JSValue {
        auto name = name_arg(ctx, argc, argv);
        if (!name) return JS_ThrowTypeError(ctx, "get: expected a variable name");
        JSValue v = lookup(ctx, store_of(ctx, magic), *name);
        if (!JS_IsUndefined(v) || magic != kPersisted) return v;
        return lookup(ctx, host_of(ctx).state().environment, *name);
    });
}

JSValue vars_set(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    return guarded(ctx, [&]() -> JSValue {
        auto name = name_arg(ctx, argc, argv);
        if (!name) return JS_ThrowTypeError(ctx, "set: expected a variable name");
        if (argc < 2) return JS_UNDEFINED;
        if (auto value = to_json(ctx, argv[1])) store_of(ctx, magic)[*name] = std::move(*value);
        return JS_UNDEFINED;
    });
}

JSValue vars_clear(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    return guarded(ctx, [&]() -> JSValue {
        auto name = name_arg(ctx, argc, argv);
        if (!name) return JS_ThrowTypeError(ctx, "clear: expected a variable name");
        store_of(ctx, magic).erase(*name);
        return JS_UNDEFINED;
    });
}

JSValue vars_clear_all(JSContext* ctx, JSValueConst, int, JSValueConst*, int magic) {
    store_of(ctx, magic) = nlohmann::json::object();
    return JS_UNDEFINED;
}

JSValue vars_is_empty(JSContext* ctx, JSValueConst, int, JSValueConst*, int magic) {
    return JS_NewBool(ctx, store_of(ctx, magic).empty());
}

JSValue make_variables(JSContext* ctx, int magic) {
    JSValue obj = JS_NewObject(ctx);
    set_function(ctx, obj, "get", vars_get, 1, magic);
    set_function(ctx, obj, "set", vars_set, 2, magic);
    set_function(ctx, obj, "clear", vars_clear, 1, magic);
    set_function(ctx, obj, "clearAll", vars_clear_all, 0, magic);
    set_function(ctx, obj, "isEmpty", vars_is_empty, 0, magic);
    return obj;
}

// ---- client

JSValue client_log(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, [&]() -> JSValue {
        std::string line;
        for (int i = 0; i < argc; ++i) {
            if (i) line += ' ';
            std::optional<nlohmann::json> j;
            if (JS_IsObject(argv[i]) && !JS_IsFunction(ctx, argv[i])) j = to_json(ctx, argv[i]);
            line += j ? j->dump() : to_std_string(ctx, argv[i]);
        }
        std::cout << line << std::endl;
        return JS_UNDEFINED;
    });
}

JSValue client_test(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, [&]() -> JSValue {
        auto name = name_arg(ctx, argc, argv);
        if (!name) return JS_ThrowTypeError(ctx, "client.test: expected a test name");
        if (argc < 2 || !JS_IsFunction(ctx, argv[1])) return JS_ThrowTypeError(ctx, "client.test: expected a test function");
        JSValue r = JS_Call(ctx, argv[1], JS_UNDEFINED, 0, nullptr);
        if (JS_IsException(r)) {
            host_of(ctx).tests().record(*name, TestError{take_exception(ctx)});
        } else {
            JS_FreeValue(ctx, r);
            host_of(ctx).tests().record(*name, TestSuccess{});
        }
        return JS_UNDEFINED;
    });
}

JSValue client_assert(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, [&]() -> JSValue {
        if (argc < 1) return JS_ThrowTypeError(ctx, "client.assert: expected a condition");
        int ok = JS_ToBool(ctx, argv[0]);
        if (ok < 0) return JS_EXCEPTION;
        if (ok) return JS_UNDEFINED;
        std::string message = "Assertion failed";
        if (argc >= 2 && !JS_IsUndefined(argv[1])) message += ": " + to_std_string(ctx, argv[1]);
        return JS_Throw(ctx, new_string(ctx, message));
    });
}

// ---- generators

JSValue gen_uuid(JSContext* ctx, JSValueConst, int, JSValueConst*) { return new_string(ctx, generators::uuid()); }
JSValue gen_email(JSContext* ctx, JSValueConst, int, JSValueConst*) { return new_string(ctx, generators::email()); }
JSValue gen_timestamp(JSContext* ctx, JSValueConst, int, JSValueConst*) { return JS_NewInt64(ctx, generators::timestamp()); }
JSValue gen_iso_timestamp(JSContext* ctx, JSValueConst, int, JSValueConst*) {
    return new_string(ctx, generators::iso_timestamp());
}

enum { kInteger = 0, kFloat = 1 };

// $random.integer(...) / $random.float(...), also used as their toString/valueOf.
JSValue random_number(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    return guarded(ctx, [&]() -> JSValue {
        if (argc > 2) return JS_ThrowTypeError(ctx, "expected at most two arguments");
        std::vector<double> a;
        for (int i = 0; i < argc; ++i) {
            double d = 0;
            if (!JS_IsNumber(argv[i]) || JS_ToFloat64(ctx, &d, argv[i]) < 0) return JS_ThrowTypeError(ctx, "expected a number");
            if (magic == kInteger && std::floor(d) != d) return JS_ThrowTypeError(ctx, "expected an integer");
            if (magic == kInteger && !generators::fits_integer(d)) return JS_ThrowRangeError(ctx, "integer argument out of range");
            a.push_back(d);
        }
        try {
            if (magic == kInteger) {
                auto i = [&](std::size_t k) { return static_cast<std::int64_t>(a[k]); };
                if (a.empty()) return JS_NewInt64(ctx, generators::integer());
                if (a.size() == 1) return JS_NewInt64(ctx, generators::integer(i(0)));
                return JS_NewInt64(ctx, generators::integer(i(0), i(1)));
            }
            if (a.empty()) return JS_NewFloat64(ctx, generators::real());
            if (a.size() == 1) return JS_NewFloat64(ctx, generators::real(a[0]));
            return JS_NewFloat64(ctx, generators::real(a[0], a[1]));
        } catch (const std::invalid_argument& e) {
            return JS_ThrowRangeError(ctx, "%s", e.what());
        }
    });
}

JSValue random_number_getter(JSContext* ctx, JSValueConst, int, JSValueConst*, int magic) {
    const char* name = magic == kInteger ? "integer" : "float";
    JSValue fn = JS_NewCFunctionMagic(ctx, random_number, name, 2, JS_CFUNC_generic_magic, magic);
    set_function(ctx, fn, "toString", random_number, 0, magic);
    set_function(ctx, fn, "valueOf", random_number, 0, magic);
    return fn;
}

enum { kAlphabetic = 0, kAlphanumeric = 1, kHexadecimal = 2 };

JSValue random_string(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    return guarded(ctx, [&]() -> JSValue {
        double d = -1;
        if (argc != 1 || !JS_IsNumber(argv[0]) || JS_ToFloat64(ctx, &d, argv[0]) < 0 || d < 0 || std::floor(d) != d)
            return JS_ThrowTypeError(ctx, "expected a non-negative integer length");
        if (!generators::fits_integer(d)) return JS_ThrowRangeError(ctx, "length out of range");
        auto length = static_cast<std::size_t>(d);
        switch (magic) {
            case kAlphabetic: return new_string(ctx, generators::alphabetic(length));
            case kAlphanumeric: return new_string(ctx, generators::alphanumeric(length));
            default: return new_string(ctx, generators::hexadecimal(length));
        }
    });
}

void install_generators(JSContext* ctx, JSValueConst global) {
    define_getter(ctx, global, "$uuid", JS_NewCFunction(ctx, gen_uuid, "$uuid", 0));
    define_getter(ctx, global, "$timestamp", JS_NewCFunction(ctx, gen_timestamp, "$timestamp", 0));
    define_getter(ctx, global, "$isoTimestamp", JS_NewCFunction(ctx, gen_iso_timestamp, "$isoTimestamp", 0));

    JSValue random = JS_NewObject(ctx);
    define_getter(ctx, random, "uuid", JS_NewCFunction(ctx, gen_uuid, "uuid", 0));
    define_getter(ctx, random, "email", JS_NewCFunction(ctx, gen_email, "email", 0));
    define_getter(ctx, random, "integer",
                  JS_NewCFunctionMagic(ctx, random_number_getter, "integer", 0, JS_CFUNC_generic_magic, kInteger));
    define_getter(ctx, random, "float",
                  JS_NewCFunctionMagic(ctx, random_number_getter, "float", 0, JS_CFUNC_generic_magic, kFloat));
    set_function(ctx, random, "alphabetic", random_string, 1, kAlphabetic);
    set_function(ctx, random, "alphanumeric", random_string, 1, kAlphanumeric);
    set_function(ctx, random, "hexadecimal", random_string, 1, kHexadecimal);
    JS_SetPropertyStr(ctx, global, "$random", random);
}

// ---- request (pre-request handler)

enum { kTarget = -1, kBody = -2 }; // magic >= 0 is a header index

const Request& current_request(JSContext* ctx) {
    const Request* req = host_of(ctx).current_request();
    if (!req) throw std::runtime_error("request is only available in pre-request handlers");
    return *req;
}

const Value* value_for(JSContext* ctx, int magic) {
    const Request& req = current_request(ctx);
    if (magic == kTarget) return &req.target;
    if (magic == kBody) return req.body ? &*req.body : nullptr;
    auto index = static_cast<std::size_t>(magic);
    if (index >= req.headers.size()) throw std::runtime_error("header no longer available");
    return &req.headers[index].field_value;
}

JSValue raw_value(JSContext* ctx, JSValueConst, int, JSValueConst*, int magic) {
    return guarded(ctx, [&]() -> JSValue {
        const Value* v = value_for(ctx, magic);
        return new_string(ctx, v ? v->text() : std::string());
    });
}

JSValue substituted_value(JSContext* ctx, JSValueConst, int, JSValueConst*, int magic) {
    return guarded(ctx, [&]() -> JSValue {
        const Value* v = value_for(ctx, magic);
        if (!v) return new_string(ctx, std::string());
        auto& host = host_of(ctx);
        return new_string(ctx, magic == kTarget ? process_target(host, *v) : process(host, *v));
    });
}

JSValue make_accessors(JSContext* ctx, const char* raw, const char* substituted, int magic) {
    JSValue obj = JS_NewObject(ctx);
    set_function(ctx, obj, raw, raw_value, 0, magic);
    set_function(ctx, obj, substituted, substituted_value, 0, magic);
    return obj;
}

JSValue make_header(JSContext* ctx, std::size_t index) {
    JSValue obj = make_accessors(ctx, "getRawValue", "tryGetSubstitutedValue", static_cast<int>(index));
    JS_SetPropertyStr(ctx, obj, "name", new_string(ctx, current_request(ctx).headers[index].field_name));
    return obj;
}

JSValue headers_all(JSContext* ctx, JSValueConst, int, JSValueConst*) {
    return guarded(ctx, [&]() -> JSValue {
        const auto& headers = current_request(ctx).headers;
        JSValue arr = JS_NewArray(ctx);
        for (std::size_t i = 0; i < headers.size(); ++i)
            JS_SetPropertyUint32(ctx, arr, static_cast<uint32_t>(i), make_header(ctx, i));
        return arr;
    });
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    return true;
}

JSValue headers_find(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, [&]() -> JSValue {
        auto name = name_arg(ctx, argc, argv);
        if (!name) return JS_ThrowTypeError(ctx, "findByName: expected a header name");
        const auto& headers = current_request(ctx).headers;
        for (std::size_t i = 0; i < headers.size(); ++i)
            if (iequals(headers[i].field_name, *name)) return make_header(ctx, i);
        return JS_NULL;
    });
}

JSValue environment_get(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, [&]() -> JSValue {
        auto name = name_arg(ctx, argc, argv);
        if (!name) return JS_ThrowTypeError(ctx, "get: expected a variable name");
        return lookup(ctx, host_of(ctx).state().environment, *name);
    });
}

} // namespace

std::string take_exception(JSContext* ctx) {
    JSValue exc = JS_GetException(ctx);
    std::string message = "<unprintable exception>";
    if (const char* s = JS_ToCString(ctx, exc)) {
        message = s;
        JS_FreeCString(ctx, s);
    } else {
        JS_FreeValue(ctx, JS_GetException(ctx));
    }
    JS_FreeValue(ctx, exc);
    return message;
}

void install_globals(JSContext* ctx) {
    JSValue global = JS_GetGlobalObject(ctx);

    JSValue client = JS_NewObject(ctx);
    set_function(ctx, client, "log", client_log, 1);
    set_function(ctx, client, "test", client_test, 2);
    set_function(ctx, client, "assert", client_assert, 2);
    JS_SetPropertyStr(ctx, client, "global", make_variables(ctx, kPersisted));
    JS_SetPropertyStr(ctx, global, "client", client);

    install_generators(ctx, global);
    JS_FreeValue(ctx, global);
}

void install_request(JSContext* ctx) {
    JSValue global = JS_GetGlobalObject(ctx);
    JSValue request = JS_NewObject(ctx);

    JSValue environment = JS_NewObject(ctx);
    set_function(ctx, environment, "get", environment_get, 1);
    JS_SetPropertyStr(ctx, request, "environment", environment);
    JS_SetPropertyStr(ctx, request, "variables", make_variables(ctx, kRequest));
    JS_SetPropertyStr(ctx, request, "url", make_accessors(ctx, "getRaw", "tryGetSubstituted", kTarget));
    JS_SetPropertyStr(ctx, request, "body", make_accessors(ctx, "getRaw", "tryGetSubstituted", kBody));

    JSValue headers = JS_NewObject(ctx);
    set_function(ctx, headers, "all", headers_all, 0);
    set_function(ctx, headers, "findByName", headers_find, 1);
    JS_SetPropertyStr(ctx, request, "headers", headers);

    JS_SetPropertyStr(ctx, global, "request", request);
    JS_FreeValue(ctx, global);
}

void install_response(JSContext* ctx, const http::Response& response) {
    nlohmann::json headers = nlohmann::json::object();
    for (const auto& [name, value] : response.headers) headers[name] = value;

    nlohmann::json body = nullptr;
    if (response.body) {
        auto parsed = nlohmann::json::parse(*response.body, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) body = std::move(parsed);
        else body = *response.body;
    }

    nlohmann::json view = {{"status", response.status_code}, {"headers", headers}, {"body", body}};
    JSValue global = JS_GetGlobalObject(ctx);
    JS_SetPropertyStr(ctx, global, "response", from_json(ctx, view));
    JS_FreeValue(ctx, global);
}

void remove_global(JSContext* ctx, const char* name) {
    JSValue global = JS_GetGlobalObject(ctx);
    JSAtom atom = JS_NewAtom(ctx, name);
    JS_DeleteProperty(ctx, global, atom, 0);
    JS_FreeAtom(ctx, atom);
    JS_FreeValue(ctx, global);
}

} // namespace httpscript::bindings
