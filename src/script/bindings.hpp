/*
 * HTTPScript QuickJS native bindings (internal)
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <quickjs.h>
#include <string>
#include <httpscript/http/http.hpp>

namespace httpscript::bindings {

// Installs `client` and the dynamic generators on the global object.
void install_globals(JSContext* ctx);
// `request` view over QuickJsHost::current_request().
void install_request(JSContext* ctx);
void install_response(JSContext* ctx, const http::Response& response);
void remove_global(JSContext* ctx, const char* name);

// Pops the pending exception and renders it as text.
std::string take_exception(JSContext* ctx);

} // namespace httpscript::bindings
