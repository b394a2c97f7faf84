/*
 * HTTPScript debug trace
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <httpscript/log.hpp>
#include <iostream>

namespace httpscript {

static bool g_debug = false;

void set_debug(bool enabled) { g_debug = enabled; }
bool debug_enabled() { return g_debug; }

void debug_log(const std::string& message) {
    if (!g_debug) return;
    std::cerr << "[debug] " << message << '\n';
}

} // namespace httpscript
