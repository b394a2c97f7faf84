/*
 * HTTPScript libcurl transport
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Blocking HttpClient on top of the curl easy interface. Redirects are
 *   followed; the reported headers are those of the final response.
 */
#pragma once
#include "httpscript/http/http.hpp"

namespace httpscript::http {

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(ClientConfig cfg = {}) : m_cfg(cfg) {}
    Response execute(const Request& request) override;

private:
    ClientConfig m_cfg;
};

// Adds "http://" when the target carries no scheme ("//host" becomes "http://host").
std::string normalize_target(const std::string& target);

} // namespace httpscript::http
