/*
 * HTTPScript debug trace
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace httpscript {

// Enabled by --debug / debug=true in the rc file.
void set_debug(bool enabled);
bool debug_enabled();

// Writes "[debug] <message>" to stderr when debug output is enabled.
void debug_log(const std::string& message);

} // namespace httpscript
