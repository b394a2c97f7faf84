/*
 * HTTPScript HTTP methods
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace httpscript::http {

enum class Method { Get, Post, Delete, Put, Patch, Options };

const char* to_string(Method method);

// Exact, case-sensitive match ("GET", "POST", ...).
std::optional<Method> method_from_string(const std::string& verb);

} // namespace httpscript::http
