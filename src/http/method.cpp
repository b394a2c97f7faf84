/*
 * HTTPScript HTTP methods
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <httpscript/http/method.hpp>

namespace httpscript::http {

const char* to_string(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        case Method::Delete: return "DELETE";
        case Method::Put: return "PUT";
        case Method::Patch: return "PATCH";
        case Method::Options: return "OPTIONS";
    }
    return "GET";
}

std::optional<Method> method_from_string(const std::string& verb) {
    if (verb == "GET") return Method::Get;
    if (verb == "POST") return Method::Post;
    if (verb == "DELETE") return Method::Delete;
    if (verb == "PUT") return Method::Put;
    if (verb == "PATCH") return Method::Patch;
    if (verb == "OPTIONS") return Method::Options;
    return std::nullopt;
}

} // namespace httpscript::http
