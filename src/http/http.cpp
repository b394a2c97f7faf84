/*
 * HTTPScript transport values
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <httpscript/http/http.hpp>

namespace httpscript::http {

const char* to_string(Version version) {
    switch (version) {
        case Version::Http09: return "HTTP/0.9";
        case Version::Http10: return "HTTP/1.0";
        case Version::Http11: return "HTTP/1.1";
        case Version::Http2: return "HTTP/2.0";
        case Version::Http3: return "HTTP/3.0";
    }
    return "HTTP/1.1";
}

std::string Response::status_line() const {
    std::string line = std::string(to_string(version)) + " " + std::to_string(status_code);
    if (!status_text.empty()) line += " " + status_text;
    return line;
}

} // namespace httpscript::http
